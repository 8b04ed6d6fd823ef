#include "handlers/discovery_handler.hpp"
#include "password_deriver.hpp"

namespace passgen {

namespace {

json::object generation_result_schema() {
    json::object props;
    props["password"] = json::object{{"type", "string"}};
    props["timestamp"] = json::object{{"type", "integer"}};
    props["length"] = json::object{{"type", "integer"}};

    json::object schema;
    schema["type"] = "object";
    schema["properties"] = std::move(props);
    schema["required"] = json::array{"password", "timestamp", "length"};
    return schema;
}

json::object error_schema() {
    json::object schema;
    schema["type"] = "object";
    schema["properties"] = json::object{{"detail", json::object{{"type", "string"}}}};
    return schema;
}

json::object length_schema() {
    json::object schema;
    schema["type"] = "integer";
    schema["minimum"] = PasswordDeriver::MIN_LENGTH;
    schema["maximum"] = PasswordDeriver::MAX_LENGTH;
    return schema;
}

json::object json_content(const char* ref) {
    json::object content;
    content["application/json"] = json::object{{"schema", json::object{{"$ref", ref}}}};
    return content;
}

json::object generate_responses() {
    json::object ok;
    ok["description"] = "Generated password";
    ok["content"] = json_content("#/components/schemas/PasswordResponse");

    json::object bad;
    bad["description"] = "Length outside the allowed range or malformed request";
    bad["content"] = json_content("#/components/schemas/Error");

    json::object failed;
    failed["description"] = "Unexpected failure while hashing";
    failed["content"] = json_content("#/components/schemas/Error");

    json::object responses;
    responses["200"] = std::move(ok);
    responses["400"] = std::move(bad);
    responses["500"] = std::move(failed);
    return responses;
}

json::object plain_ok(const char* description) {
    json::object responses;
    responses["200"] = json::object{{"description", description}};
    return responses;
}

} // namespace

const std::vector<std::string>& DiscoveryHandler::advertised_endpoints() {
    static const std::vector<std::string> endpoints = {"/generate", "/health", "/openapi.json"};
    return endpoints;
}

Response DiscoveryHandler::handle_root(unsigned version) {
    json::array endpoints;
    for (const auto& path : advertised_endpoints()) {
        endpoints.emplace_back(path);
    }

    json::object response;
    response["message"] = config_.service_name;
    response["endpoints"] = std::move(endpoints);
    response["author"] = config_.author;

    return make_json_response(http::status::ok, version, response);
}

Response DiscoveryHandler::handle_openapi(unsigned version) {
    return make_json_response(http::status::ok, version, build_openapi());
}

json::object DiscoveryHandler::build_openapi() const {
    json::object info;
    info["title"] = config_.service_name;
    info["description"] = config_.service_description;
    info["version"] = config_.service_version;

    // --- GET /generate ---
    json::object length_param;
    length_param["name"] = "length";
    length_param["in"] = "query";
    length_param["required"] = true;
    length_param["description"] = "Length of password (1-64 characters)";
    length_param["schema"] = length_schema();

    json::object phrase_schema;
    phrase_schema["type"] = "string";
    phrase_schema["default"] = config_.default_phrase;

    json::object phrase_param;
    phrase_param["name"] = "phrase";
    phrase_param["in"] = "query";
    phrase_param["required"] = false;
    phrase_param["description"] = "Base phrase for password generation";
    phrase_param["schema"] = phrase_schema;

    json::object get_generate;
    get_generate["summary"] = "Generate a password from phrase + current timestamp";
    get_generate["parameters"] = json::array{length_param, phrase_param};
    get_generate["responses"] = generate_responses();

    // --- POST /generate ---
    json::object request_props;
    request_props["length"] = length_schema();
    request_props["phrase"] = phrase_schema;

    json::object request_schema;
    request_schema["type"] = "object";
    request_schema["properties"] = std::move(request_props);
    request_schema["required"] = json::array{"length"};

    json::object post_generate;
    post_generate["summary"] = "Generate a password using a JSON body";
    post_generate["requestBody"] = json::object{
        {"required", true},
        {"content", json::object{{"application/json", json::object{{"schema", std::move(request_schema)}}}}}};
    post_generate["responses"] = generate_responses();

    json::object paths;
    paths["/"] = json::object{{"get", json::object{{"summary", "Service index"},
                                                   {"responses", plain_ok("Service metadata")}}}};
    paths["/generate"] = json::object{{"get", std::move(get_generate)}, {"post", std::move(post_generate)}};
    paths["/health"] = json::object{{"get", json::object{{"summary", "Health check"},
                                                         {"responses", plain_ok("Service is healthy")}}}};

    json::object schemas;
    schemas["PasswordResponse"] = generation_result_schema();
    schemas["Error"] = error_schema();

    json::object doc;
    doc["openapi"] = "3.0.3";
    doc["info"] = std::move(info);
    doc["paths"] = std::move(paths);
    doc["components"] = json::object{{"schemas", std::move(schemas)}};
    return doc;
}

} // namespace passgen
