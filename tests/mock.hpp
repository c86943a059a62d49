#pragma once

#include <dockhand/transport.hpp>

#include <blackhole/handler.hpp>
#include <blackhole/root.hpp>

#include <gmock/gmock.h>

#include <boost/optional.hpp>

#include <memory>
#include <string>
#include <vector>

namespace dockhand {
namespace test {

typedef boost::optional<std::string> raw_t;

class transport_mock : public transport_t {
public:
    MOCK_METHOD1(send, raw_t(const std::string&));
};

// Root logger without handlers, everything written to it is dropped.
inline
std::shared_ptr<logging::logger_t>
null_logger() {
    return std::make_shared<blackhole::root_logger_t>(std::vector<std::unique_ptr<blackhole::handler_t>>());
}

inline
raw_t
reply(const std::string& body, const std::string& status = "200 OK") {
    return raw_t("HTTP/1.1 " + status + "\r\n"
                 "Content-Type: application/json\r\n"
                 "Content-Length: " + std::to_string(body.size()) + "\r\n"
                 "\r\n" + body);
}

}  // namespace test
}  // namespace dockhand
