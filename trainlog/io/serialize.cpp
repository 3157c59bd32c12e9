#include <cstdio>
#include <ctime>
#include <trainlog/io/serialize.hpp>
#include <trainlog/util/protobuf.hpp>

namespace trainlog {

std::string workout_id(const std::string& date) {
    std::string digits;
    for (char c : date) {
        if ('0' <= c and c <= '9') {
            digits.push_back(c);
        }
    }
    std::string time = digits.size() > 8 ? digits.substr(8, 6) : "";
    time.resize(6, '0');
    return "w_" + digits.substr(0, 8) + "_" + time;
}

std::string utc_timestamp() {
    const time_t now = time(nullptr);
    struct tm parts;
    gmtime_r(&now, &parts);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts);
    return buffer;
}

void dump(const Exercise& exercise, protobuf::Exercise& message) {
    message.Clear();
    message.set_name(exercise.name());
    message.set_equipment(DEFAULT_EQUIPMENT);
    uint32_t set_number = 0;
    for (const auto& set : exercise.sets()) {
        auto& set_message = *message.add_sets();
        set_message.set_set_number(++set_number);
        set_message.set_repetitions(set.repetitions);
        set_message.mutable_weight()->set_amount(set.weight.amount);
        set_message.mutable_weight()->set_unit(WEIGHT_UNIT);
    }
}

void dump(const ParsedSession& session, protobuf::Workout& message) {
    message.Clear();
    const std::string date =
        session.date.empty() ? utc_timestamp() : session.date;
    message.set_workout_id(workout_id(date));
    message.set_type(WORKOUT_TYPE);
    message.set_date(date);
    message.set_location("");
    std::string notes;
    for (const auto& note : session.notes) {
        if (not notes.empty()) notes += '\n';
        notes += note;
    }
    message.set_notes(notes);
    for (const auto& exercise : session.exercises) {
        dump(exercise, *message.add_exercises());
    }
}

void dump(const std::vector<ParsedSession>& sessions,
          const std::string& timestamp, protobuf::Export& message) {
    message.Clear();
    message.set_export_timestamp(timestamp);
    for (const auto& session : sessions) {
        dump(session, *message.add_workouts());
    }
}

void dump(const std::vector<Synonym>& entries,
          protobuf::SynonymTable& message) {
    message.Clear();
    for (const auto& entry : entries) {
        auto& entry_message = *message.add_entries();
        entry_message.set_canonical(entry.canonical);
        for (const auto& synonym : entry.synonyms) {
            entry_message.add_synonyms(synonym);
        }
    }
}

std::vector<Synonym> load(const protobuf::SynonymTable& message) {
    std::vector<Synonym> entries;
    for (const auto& entry_message : message.entries()) {
        Synonym entry;
        entry.canonical = entry_message.canonical();
        entry.synonyms.assign(entry_message.synonyms().begin(),
                              entry_message.synonyms().end());
        entries.push_back(entry);
    }
    return entries;
}

std::vector<Synonym> load_synonyms_from_env() {
    const char* filename = getenv_default("TRAINLOG_SYNONYMS", "");
    if (not *filename) {
        return std::vector<Synonym>();
    }
    TRAINLOG_INFO("loading synonyms from " << filename);
    protobuf::SynonymTable message;
    protobuf::InFile(filename).read(message);
    return load(message);
}

//----------------------------------------------------------------------------
// tsv

std::string format_tsv_weight(double amount) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.1f", amount);
    std::string text = buffer;
    for (auto& c : text) {
        if (c == '.') c = ',';
    }
    return text;
}

void write_tsv_header(std::ostream& o) {
    o << "Date\tExercise\tSets\tAvg Reps\tWeight\n";
}

void write_tsv_rows(std::ostream& o, const ParsedSession& session) {
    for (const auto& exercise : session.exercises) {
        for (const auto& run : exercise.flatten()) {
            const auto& sets = run.sets();
            TRAINLOG_ASSERT1(not sets.empty(), "empty run of " << run.name());
            uint64_t total = 0;
            for (const auto& set : sets) {
                total += set.repetitions;
            }
            o << session.date << '\t' << run.name() << '\t' << sets.size()
              << '\t' << (total / sets.size()) << '\t'
              << format_tsv_weight(sets.front().weight.amount) << '\n';
        }
    }
}

}  // namespace trainlog
