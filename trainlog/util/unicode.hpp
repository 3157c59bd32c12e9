#pragma once

#include <string>

namespace trainlog {

// Folds UTF-8 text for comparison: ASCII letters are lower-cased and accented
// Latin letters (U+00C0 to U+017F) are replaced by their unaccented lower-case
// base. Everything else, including malformed bytes, is copied unchanged.
std::string fold_case_and_accents(const std::string& text);

}  // namespace trainlog
