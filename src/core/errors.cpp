#include "cmdtree/errors.hpp"

namespace cmdtree {

namespace {

std::string load_failure_message(const std::string& location, const std::string& cause) {
    return "Problem loading " + location + ": " + cause + ".";
}

} // namespace

LoadFailure::LoadFailure(const std::string& location, std::exception_ptr cause)
    : Error(load_failure_message(location, describe_exception(cause))),
      location_(location),
      cause_(cause),
      cause_message_(describe_exception(cause)) {}

LoadFailure::LoadFailure(const std::string& location, const std::string& cause_message)
    : Error(load_failure_message(location, cause_message)),
      location_(location),
      cause_(std::make_exception_ptr(std::runtime_error(cause_message))),
      cause_message_(cause_message) {}

void LoadFailure::rethrow_cause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
}

std::string describe_exception(std::exception_ptr ex) {
    if (!ex) return "unknown error";
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s ? s : "unknown error";
    } catch (...) {
        return "unknown error";
    }
}

} // namespace cmdtree
