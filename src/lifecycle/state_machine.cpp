#include <warden/lifecycle/state_machine.hpp>

#include <spdlog/spdlog.h>

using namespace warden::schema;

namespace warden::lifecycle {

namespace {

operation_result<status_t> reject(std::string log) {
  spdlog::warn("status transition rejected: {}", log);
  return make_failure<status_t>(error_code_t::invalid_transition,
                                std::move(log), kStatusCodespace);
}

}  // namespace

operation_result<status_t> transition(const status_type_t current,
                                      const transition_request& request,
                                      const timestamp_milliseconds_t now) {
  auto has_reason = request.reason.has_value() && !request.reason->empty();
  if (requires_reason(request.status_type) && !has_reason) {
    return reject(std::string{to_string(request.status_type)} +
                  " requires a reason");
  }

  if (request.status_type == status_type_t::suspended_temporarily) {
    if (!request.suspended_until.has_value()) {
      return reject("temporary suspension requires an end time");
    }
    if (*request.suspended_until <= now) {
      return reject("suspension end time must be in the future");
    }
  } else if (request.suspended_until.has_value()) {
    return reject("only a temporary suspension carries an end time");
  }

  auto next = status_t{};
  next.status_type = request.status_type;
  if (has_reason) {
    next.reason = request.reason;
  }
  next.suspended_until = request.suspended_until;

  spdlog::debug("status transition {} -> {}", to_string(current),
                to_string(next.status_type));
  return make_success(std::move(next));
}

bool is_expired(const status_t& status, const timestamp_milliseconds_t now) {
  return status.status_type == status_type_t::suspended_temporarily &&
         status.suspended_until.has_value() && now >= *status.suspended_until;
}

status_t make_pending() {
  return status_t{};
}

status_t make_accepted() {
  auto status = status_t{};
  status.status_type = status_type_t::accepted;
  return status;
}

transition_request make_suspension(std::string reason,
                                   const std::optional<uint32_t> days,
                                   const timestamp_milliseconds_t now) {
  auto request = transition_request{};
  request.reason = std::move(reason);
  if (days.has_value()) {
    request.status_type = status_type_t::suspended_temporarily;
    request.suspended_until = now + (kMillisecondsPerDay * *days);
  } else {
    request.status_type = status_type_t::suspended_indefinitely;
  }
  return request;
}

}  // namespace warden::lifecycle
