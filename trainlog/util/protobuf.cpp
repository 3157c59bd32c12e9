#include <google/protobuf/util/json_util.h>
#include <trainlog/util/protobuf.hpp>

namespace trainlog {
namespace protobuf {

std::string to_json(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    // Renamed always_print_fields_with_no_presence in protobuf 26.
    options.always_print_primitive_fields = true;

    std::string json;
    const auto status =
        google::protobuf::util::MessageToJsonString(message, &json, options);
    TRAINLOG_ASSERT(status.ok(), "failed to print "
                                     << message.GetTypeName() << ": "
                                     << status.ToString());
    return json;
}

bool from_json(const std::string& json, google::protobuf::Message& message,
               std::vector<std::string>& error_log) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    const auto status =
        google::protobuf::util::JsonStringToMessage(json, &message, options);
    if (not status.ok()) {
        error_log.push_back(status.ToString());
        TRAINLOG_WARN("bad " << message.GetTypeName() << " json: "
                             << status.ToString());
        return false;
    }
    return true;
}

}  // namespace protobuf
}  // namespace trainlog
