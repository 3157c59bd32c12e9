#pragma once

#include <atomic>
#include <string>
#include <trainlog/util/util.hpp>
#include <unordered_map>
#include <vector>

namespace trainlog {

struct Synonym {
    std::string canonical;
    std::vector<std::string> synonyms;
};

// Comparison key of an exercise name: whitespace collapsed, case folded and
// accents removed.
std::string match_key(const std::string& name);

// Checks that canonical names are unique and that no synonym is claimed by
// two entries, comparing match keys. Appends one message per conflict.
bool check_synonyms(const std::vector<Synonym>& entries,
                    std::vector<std::string>& error_log);

class SynonymTable {
   public:
    SynonymTable() {}
    explicit SynonymTable(const std::vector<Synonym>& entries);

    static SynonymTable defaults();

    void extend(const std::vector<Synonym>& entries);

    // Returns the canonical name for a match key, or nullptr.
    const std::string* find(const std::string& key) const;

    const std::vector<Synonym>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }

   private:
    std::vector<Synonym> m_entries;
    std::unordered_map<std::string, size_t> m_index;
};

// Maps raw exercise names to canonical names. Unknown names pass through
// with whitespace normalized and casing untouched.
//
// The table may be extended until the first call to standardize(); after
// that it is read-only and safe to share between threads.
class NameStandardizer : noncopyable {
   public:
    explicit NameStandardizer(const SynonymTable& table =
                                  SynonymTable::defaults());

    void extend(const std::vector<Synonym>& entries);
    std::string standardize(const std::string& raw) const;

    const SynonymTable& table() const { return m_table; }

   private:
    SynonymTable m_table;
    mutable std::atomic<bool> m_frozen;
};

}  // namespace trainlog
