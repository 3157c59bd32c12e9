#pragma once

#include <ostream>
#include <string>
#include <trainlog/model/errors.hpp>
#include <trainlog/model/standardize.hpp>
#include <trainlog/model/syntax.hpp>
#include <trainlog/model/weight.hpp>
#include <vector>

namespace trainlog {

// One exercise line: a standardized name and its sets in notation order.
class Exercise {
   public:
    Exercise(const std::string& name, const std::vector<SetEntry>& sets)
        : m_name(name), m_sets(sets) {}

    const std::string& name() const { return m_name; }
    const std::vector<SetEntry>& sets() const { return m_sets; }

    // Splits into runs of consecutive sets sharing one weight.
    std::vector<Exercise> flatten() const;

    bool operator==(const Exercise& o) const {
        return m_name == o.m_name and m_sets == o.m_sets;
    }
    bool operator!=(const Exercise& o) const { return not operator==(o); }

   private:
    std::string m_name;
    std::vector<SetEntry> m_sets;
};

// Prints e.g. "Bench Press: 4 - 10kg, 5 - 10kg".
std::ostream& operator<<(std::ostream& o, const Exercise& exercise);

// Standardizes the name and evaluates root with no ambient weight.
// Throws MalformedSetError when no set results, and propagates evaluator
// errors unchanged.
Exercise assemble_exercise(const std::string& raw_name, const SetExpr& root,
                           const NameStandardizer& standardizer);

}  // namespace trainlog
