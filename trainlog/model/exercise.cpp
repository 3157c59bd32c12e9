#include <trainlog/model/evaluator.hpp>
#include <trainlog/model/exercise.hpp>

namespace trainlog {

std::vector<Exercise> Exercise::flatten() const {
    std::vector<Exercise> result;
    std::vector<SetEntry> run;
    for (const auto& set : m_sets) {
        if (not run.empty() and run.back().weight != set.weight) {
            result.push_back(Exercise(m_name, run));
            run.clear();
        }
        run.push_back(set);
    }
    if (not run.empty()) {
        result.push_back(Exercise(m_name, run));
    }
    return result;
}

std::ostream& operator<<(std::ostream& o, const Exercise& exercise) {
    o << exercise.name() << ": ";
    const auto& sets = exercise.sets();
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i) {
            o << ", ";
        }
        o << sets[i];
    }
    return o;
}

Exercise assemble_exercise(const std::string& raw_name, const SetExpr& root,
                           const NameStandardizer& standardizer) {
    const std::string name = standardizer.standardize(raw_name);
    std::vector<SetEntry> sets = evaluate(root);
    if (sets.empty()) {
        throw MalformedSetError("no sets documented for " + name);
    }
    return Exercise(name, sets);
}

}  // namespace trainlog
