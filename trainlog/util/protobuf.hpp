#pragma once

#include <google/protobuf/message.h>
#include <trainlog/util/util.hpp>

namespace trainlog {
namespace protobuf {

// Renders message as indented JSON, printing fields that hold defaults.
std::string to_json(const google::protobuf::Message& message);

// Returns false and appends to error_log on malformed JSON.
bool from_json(const std::string& json, google::protobuf::Message& message,
               std::vector<std::string>& error_log);

class InFile : noncopyable {
    const std::string m_filename;
    std::ifstream m_file;

   public:
    explicit InFile(const std::string& filename)
        : m_filename(filename), m_file(filename) {
        TRAINLOG_ASSERT(m_file, "failed to open file " << filename);
    }

    const std::string& filename() const { return m_filename; }

    template <class Message>
    void read(Message& message) {
        std::ostringstream json;
        json << m_file.rdbuf();
        std::vector<std::string> error_log;
        bool info = from_json(json.str(), message, error_log);
        TRAINLOG_ASSERT(info, "failed to parse " << m_filename << ": "
                                                 << error_log.back());
    }
};

class OutFile : noncopyable {
    const std::string m_filename;
    std::ofstream m_file;

   public:
    explicit OutFile(const std::string& filename)
        : m_filename(filename), m_file(filename, std::ios::trunc) {
        TRAINLOG_ASSERT(m_file, "failed to open file " << filename);
    }

    const std::string& filename() const { return m_filename; }

    template <class Message>
    void write(const Message& message) {
        m_file << to_json(message) << std::flush;
        TRAINLOG_ASSERT(m_file, "failed to write to " << m_filename);
    }
};

}  // namespace protobuf
}  // namespace trainlog
