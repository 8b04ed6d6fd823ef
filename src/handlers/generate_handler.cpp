#include "handlers/generate_handler.hpp"
#include "input_validator.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

#include <limits>
#include <stdexcept>

namespace passgen {

Response GenerateHandler::handle_get(const Request& req, const std::string& remote_addr) {
    std::map<std::string, std::string> params;
    try {
        params = InputValidator::parse_query(target_query(to_std_view(req.target())));
    } catch (const std::invalid_argument&) {
        return reject(req.version(), "Malformed query string", remote_addr);
    }

    auto length_it = params.find("length");
    if (length_it == params.end()) {
        return reject(req.version(), "Missing required parameter: length", remote_addr);
    }

    auto length = InputValidator::parse_int64(length_it->second);
    if (!length) {
        // Above INT64_MAX but within uint64: out of range, as the POST binding reports it.
        if (InputValidator::parse_uint64(length_it->second)) {
            return reject(req.version(), PasswordDeriver::length_range_message(), remote_addr);
        }
        return reject(req.version(), "Invalid value for parameter length: must be an integer", remote_addr);
    }

    // Range is enforced here, ahead of the handler body, to mirror the POST binding.
    if (!PasswordDeriver::is_valid_length(*length)) {
        return reject(req.version(), PasswordDeriver::length_range_message(), remote_addr);
    }

    GenerationRequest request;
    request.length = *length;
    auto phrase_it = params.find("phrase");
    request.phrase = (phrase_it != params.end()) ? phrase_it->second : config_.default_phrase;

    return generate(request, req.version(), remote_addr);
}

Response GenerateHandler::handle_post(const Request& req, const std::string& remote_addr) {
    json::value body;
    try {
        body = InputValidator::safe_parse_json(req.body());
    } catch (const std::exception&) {
        return reject(req.version(), "Invalid request format", remote_addr);
    }
    if (!body.is_object()) {
        return reject(req.version(), "Invalid request format", remote_addr);
    }
    const auto& obj = body.as_object();

    auto length_it = obj.find("length");
    if (length_it == obj.end()) {
        return reject(req.version(), "Missing required field: length", remote_addr);
    }

    GenerationRequest request;
    const json::value& length_val = length_it->value();
    if (length_val.is_int64()) {
        request.length = length_val.as_int64();
    } else if (length_val.is_uint64()) {
        // Only reachable above INT64_MAX; clamp so the range check below rejects it.
        request.length = std::numeric_limits<int64_t>::max();
    } else {
        return reject(req.version(), "Invalid value for field length: must be an integer", remote_addr);
    }

    auto phrase_it = obj.find("phrase");
    if (phrase_it == obj.end() || phrase_it->value().is_null()) {
        request.phrase = config_.default_phrase;
    } else if (phrase_it->value().is_string()) {
        request.phrase = std::string(phrase_it->value().as_string());
    } else {
        return reject(req.version(), "Invalid value for field phrase: must be a string", remote_addr);
    }

    if (!PasswordDeriver::is_valid_length(request.length)) {
        return reject(req.version(), PasswordDeriver::length_range_message(), remote_addr);
    }

    return generate(request, req.version(), remote_addr);
}

Response GenerateHandler::generate(const GenerationRequest& request, unsigned version,
                                   const std::string& remote_addr) {
    auto result = deriver_.derive(request);

    if (auto* failure = std::get_if<DerivationFailure>(&result)) {
        if (failure->code == DerivationError::InternalFailure) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::INTERNAL_ERROR,
                             remote_addr, failure->detail);
            MetricsRegistry::instance().increment_counter(metric::GENERATE_FAILED);
            return make_error_response(http::status::internal_server_error, version, failure->detail);
        }
        return reject(version, failure->detail, remote_addr);
    }

    const auto& generated = std::get<GenerationResult>(result);
    MetricsRegistry::instance().increment_counter(metric::PASSWORDS_GENERATED);

    json::object response;
    response["password"] = generated.password;
    response["timestamp"] = generated.timestamp;
    response["length"] = generated.length;
    return make_json_response(http::status::ok, version, response);
}

Response GenerateHandler::reject(unsigned version, const std::string& detail, const std::string& remote_addr) {
    EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT, remote_addr,
                     "Generate rejected: " + detail);
    MetricsRegistry::instance().increment_counter(metric::GENERATE_REJECTED);
    return make_error_response(http::status::bad_request, version, detail);
}

} // namespace passgen
