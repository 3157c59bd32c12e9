#include <trainlog/model/standardize.hpp>
#include <trainlog/util/unicode.hpp>

namespace trainlog {

std::string match_key(const std::string& name) {
    return fold_case_and_accents(collapse_whitespace(name));
}

bool check_synonyms(const std::vector<Synonym>& entries,
                    std::vector<std::string>& error_log) {
    const size_t error_count = error_log.size();
    std::unordered_map<std::string, std::string> canonical_owner;
    std::unordered_map<std::string, std::string> synonym_owner;

    for (const auto& entry : entries) {
        const std::string canonical = match_key(entry.canonical);
        if (canonical.empty()) {
            error_log.push_back("empty canonical name");
            continue;
        }
        auto pair = canonical_owner.insert(
            std::make_pair(canonical, entry.canonical));
        if (not pair.second) {
            error_log.push_back("repeated canonical name: " + entry.canonical);
        }
    }

    for (const auto& entry : entries) {
        const std::string canonical = match_key(entry.canonical);
        for (const auto& synonym : entry.synonyms) {
            const std::string key = match_key(synonym);
            if (key.empty()) {
                error_log.push_back("empty synonym of " + entry.canonical);
                continue;
            }
            auto pair =
                synonym_owner.insert(std::make_pair(key, entry.canonical));
            if (not pair.second) {
                error_log.push_back("synonym '" + synonym + "' of " +
                                    entry.canonical + " already belongs to " +
                                    pair.first->second);
                continue;
            }
            auto owner = canonical_owner.find(key);
            if (owner != canonical_owner.end() and key != canonical) {
                error_log.push_back("synonym '" + synonym + "' of " +
                                    entry.canonical +
                                    " is the canonical name " + owner->second);
            }
        }
    }

    return error_log.size() == error_count;
}

//----------------------------------------------------------------------------
// SynonymTable

SynonymTable::SynonymTable(const std::vector<Synonym>& entries) {
    extend(entries);
}

SynonymTable SynonymTable::defaults() {
    return SynonymTable({
        {"Overhead Press", {"oh", "op"}},
        {"Inclined Bench Press", {"ibp"}},
        {"Bench Press", {"bench", "bp", "press de banca"}},
        {"Machine Lateral Pull-Down",
         {"lat pull-down", "lat pull down", "mlpd"}},
        {"Lateral Pull-Down", {"lpd"}},
        {"Machine Row", {"mr"}},
        {"Low Row", {"lr"}},
        {"Row", {"r"}},
        {"Barbell Row", {"br"}},
        {"Squat", {"s", "sentadilla"}},
        {"Deadlift", {"d", "peso muerto"}},
        {"Leg Extension", {"le", "extensión de cuádriceps"}},
        {"Leg Curl", {"lc"}},
        {"Machine Leg Press", {"mlp", "leg press machine"}},
        {"Smith Machine Squat", {"sms", "sm squat"}},
        {"Dumbbell Curl", {"db curl", "dbc"}},
    });
}

void SynonymTable::extend(const std::vector<Synonym>& entries) {
    std::vector<Synonym> merged = m_entries;
    merged.insert(merged.end(), entries.begin(), entries.end());
    std::vector<std::string> error_log;
    if (not check_synonyms(merged, error_log)) {
        std::ostringstream message;
        for (const auto& error : error_log) {
            message << "\n\t" << error;
        }
        TRAINLOG_ERROR("invalid synonym table:" << message.str());
    }

    for (const auto& entry : entries) {
        const size_t pos = m_entries.size();
        m_entries.push_back(entry);
        m_index[match_key(entry.canonical)] = pos;
        for (const auto& synonym : entry.synonyms) {
            m_index[match_key(synonym)] = pos;
        }
    }
    TRAINLOG_DEBUG("synonym table has " << m_entries.size() << " entries");
}

const std::string* SynonymTable::find(const std::string& key) const {
    auto iter = m_index.find(key);
    if (iter == m_index.end()) {
        return nullptr;
    }
    return &m_entries[iter->second].canonical;
}

//----------------------------------------------------------------------------
// NameStandardizer

NameStandardizer::NameStandardizer(const SynonymTable& table)
    : m_table(table), m_frozen(false) {}

void NameStandardizer::extend(const std::vector<Synonym>& entries) {
    TRAINLOG_ASSERT(not m_frozen.load(std::memory_order_acquire),
                    "synonym table extended after first lookup");
    m_table.extend(entries);
}

std::string NameStandardizer::standardize(const std::string& raw) const {
    m_frozen.store(true, std::memory_order_release);
    const std::string normalized = collapse_whitespace(raw);
    if (const std::string* canonical =
            m_table.find(fold_case_and_accents(normalized))) {
        return *canonical;
    }
    return normalized;
}

}  // namespace trainlog
