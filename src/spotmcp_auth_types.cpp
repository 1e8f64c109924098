#include "spotmcp_auth_types.hpp"
#include <chrono>

namespace spotmcp {

int64_t CurrentEpochSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

CallbackResult CallbackResult::Success(const std::string& code, const std::string& state) {
    CallbackResult result;
    result.code = code;
    result.state = state;
    return result;
}

CallbackResult CallbackResult::Failure(const std::string& error) {
    CallbackResult result;
    result.error = error;
    return result;
}

} // namespace spotmcp
