#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include "tempest/api/failure/v1/message.pb.h"

#include <tempest/framework/cancellation.hpp>
#include <tempest/framework/converter.hpp>
#include <tempest/framework/error.hpp>

#include "options.hpp"

using namespace tempest::framework;

namespace {

template<typename T>
std::string
optional_string(const boost::optional<T>& value) {
    if (value) {
        return to_string(*value);
    }

    return "<none>";
}

void
describe(const failure_error& err) {
    std::cout << "  kind: " << err.code().message() << std::endl;
    std::cout << "  message: '" << err.message() << "'" << std::endl;
    std::cout << "  display: '" << err.what() << "'" << std::endl;

    if (auto e = dynamic_cast<const application_error*>(&err)) {
        std::cout << "  type: " << (e->type() ? *e->type() : "<none>") << std::endl;
        std::cout << "  non retryable: " << std::boolalpha << e->non_retryable() << std::endl;
        std::cout << "  details: " << e->details().size() << std::endl;
        if (e->next_retry_delay()) {
            std::cout << "  next retry delay: " << e->next_retry_delay()->count() << " ms" << std::endl;
        }
    } else if (auto e = dynamic_cast<const timeout_error*>(&err)) {
        std::cout << "  timeout type: " << optional_string(e->type()) << std::endl;
        std::cout << "  last heartbeat details: " << e->last_heartbeat_details().size() << std::endl;
    } else if (auto e = dynamic_cast<const server_error*>(&err)) {
        std::cout << "  non retryable: " << std::boolalpha << e->non_retryable() << std::endl;
    } else if (auto e = dynamic_cast<const activity_error*>(&err)) {
        std::cout << "  activity: " << e->activity_type() << " [" << e->activity_id() << "]" << std::endl;
        std::cout << "  identity: " << e->identity() << std::endl;
        std::cout << "  events: " << e->scheduled_event_id() << " -> " << e->started_event_id() << std::endl;
        std::cout << "  retry state: " << optional_string(e->retry_state()) << std::endl;
    } else if (auto e = dynamic_cast<const child_workflow_error*>(&err)) {
        std::cout << "  workflow: " << e->ns() << "/" << e->workflow_type()
                  << " [" << e->workflow_id() << ", " << e->run_id() << "]" << std::endl;
        std::cout << "  events: " << e->initiated_event_id() << " -> " << e->started_event_id() << std::endl;
        std::cout << "  retry state: " << optional_string(e->retry_state()) << std::endl;
    }
}

bool
read(const inspect::options_t& options, wire_failure_t& failure) {
    std::ifstream stream(options.input, std::ios::binary);
    if (!stream) {
        std::cerr << "ERROR: unable to open '" << options.input << "'" << std::endl;
        return false;
    }

    if (options.text) {
        const std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
        return google::protobuf::TextFormat::ParseFromString(content, &failure);
    }

    return failure.ParseFromIstream(&stream);
}

} // namespace

int main(int argc, char** argv) {
    const inspect::options_t options(argc, argv);

    wire_failure_t failure;
    if (!read(options, failure)) {
        std::cerr << "ERROR: unable to parse the failure" << std::endl;
        return 1;
    }

    converter_options_t settings;
    settings.encode_common_attributes = options.encode_common_attributes;

    const failure_converter_t converter(settings);
    const std::exception_ptr err = converter.from_failure(failure);

    std::exception_ptr current = err;
    for (std::size_t depth = 0; current; ++depth) {
        std::cout << "#" << depth << std::endl;

        try {
            std::rethrow_exception(current);
        } catch (const failure_error& e) {
            describe(e);
            current = e.cause();
        }
    }

    std::cout << "cancellation: " << std::boolalpha << is_cancellation(err) << std::endl;

    wire_failure_t encoded;
    converter.to_failure(err, encoded);

    const bool same = google::protobuf::util::MessageDifferencer::Equals(failure, encoded);
    std::cout << "round trip: " << (same ? "identical" : "differs") << std::endl;

    return 0;
}
