#include "host/scene_commands.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "host/script_runner.hpp"
#include "host/viewport_capture.hpp"
#include "registry/command_catalog.hpp"

namespace hostbridge::host {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;
using registry::CommandHandler;

namespace {

constexpr std::size_t kMaxErrorTail = 2000;

struct ScriptContext {
    std::filesystem::path directory;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

BridgeError handler_error(std::string message, std::string code) {
    return BridgeError{ErrorKind::Handler, std::move(message), std::move(code)};
}

BridgeError shape_error(std::string message, std::string code) {
    return BridgeError{ErrorKind::Shape, std::move(message), std::move(code)};
}

json describe_layer(const Layer& layer) {
    return {{"name", layer.name},
            {"id", layer.id},
            {"color", layer.color},
            {"is_visible", layer.visible},
            {"is_locked", layer.locked}};
}

json bbox_corners(const SceneObject& object) {
    const auto& lo = object.min_corner;
    const auto& hi = object.max_corner;
    return json::array({json::array({lo[0], lo[1], lo[2]}), json::array({hi[0], lo[1], lo[2]}),
                        json::array({hi[0], hi[1], lo[2]}), json::array({lo[0], hi[1], lo[2]}),
                        json::array({lo[0], lo[1], hi[2]}), json::array({hi[0], lo[1], hi[2]}),
                        json::array({hi[0], hi[1], hi[2]}), json::array({lo[0], hi[1], hi[2]})});
}

std::optional<std::string> string_filter(const json& filters, const char* key,
                                         BridgeError& error) {
    if (!filters.contains(key) || filters.at(key).is_null()) {
        return std::nullopt;
    }
    if (!filters.at(key).is_string()) {
        error = shape_error(std::string("get_objects_with_metadata: filters.") + key +
                                " must be a string",
                            "param_type_mismatch");
        return std::nullopt;
    }
    return filters.at(key).get<std::string>();
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string tail(const std::string& text) {
    if (text.size() <= kMaxErrorTail) {
        return text;
    }
    return "..." + text.substr(text.size() - kMaxErrorTail);
}

// Command handlers. Each one receives params already normalized against
// the catalog, so only value-level checks remain.

core::errors::Result<json> get_simple_info(const SceneDocument& document) {
    return json{{"host_version", document.version()},
                {"file_path", document.file_path()},
                {"units", document.units()}};
}

core::errors::Result<json> get_scene_info(const SceneDocument& document) {
    json objects = json::array();
    for (const auto& object : document.objects()) {
        objects.push_back({{"id", object.id},
                           {"name", object.name.empty() ? "Unnamed" : object.name},
                           {"type", object.type},
                           {"layer", object.layer},
                           {"is_visible", object.visible}});
    }
    json layers = json::array();
    for (const auto& layer : document.layers()) {
        layers.push_back(describe_layer(layer));
    }
    return json{{"host_version", document.version()},
                {"file_path", document.file_path()},
                {"units", document.units()},
                {"objects_count", objects.size()},
                {"layers_count", layers.size()},
                {"objects", std::move(objects)},
                {"layers", std::move(layers)}};
}

core::errors::Result<json> get_layers(const SceneDocument& document) {
    json layers = json::array();
    const std::string& current = document.current_layer().name;
    for (const auto& layer : document.layers()) {
        json entry = describe_layer(layer);
        entry["is_current"] = layer.name == current;
        layers.push_back(std::move(entry));
    }
    return json{{"count", layers.size()},
                {"layers", std::move(layers)},
                {"current_layer", current}};
}

core::errors::Result<json> get_objects_with_metadata(const SceneDocument& document,
                                                     const json& params) {
    const json& filters = params.at("filters");
    BridgeError error{ErrorKind::Shape, ""};
    const auto layer = string_filter(filters, "layer", error);
    const auto name = string_filter(filters, "name", error);
    const auto short_id = string_filter(filters, "short_id", error);
    if (!error.message.empty()) {
        return error;
    }

    std::vector<std::string> fields;
    if (params.contains("metadata_fields")) {
        for (const auto& field : params.at("metadata_fields")) {
            if (!field.is_string()) {
                return shape_error(
                    "get_objects_with_metadata: metadata_fields must be strings",
                    "param_type_mismatch");
            }
            fields.push_back(field.get<std::string>());
        }
    }

    json objects = json::array();
    for (const auto& object : document.objects()) {
        if (layer && !wildcard_match(*layer, object.layer)) {
            continue;
        }
        if (name && !wildcard_match(*name, object.name)) {
            continue;
        }
        if (short_id && object.short_id != *short_id) {
            continue;
        }

        json full = describe_object(object);
        if (fields.empty()) {
            objects.push_back(std::move(full));
            continue;
        }
        json projected = {{"id", object.id}};
        for (const auto& field : fields) {
            if (full.contains(field)) {
                projected[field] = full.at(field);
            }
        }
        objects.push_back(std::move(projected));
    }
    return json{{"count", objects.size()}, {"objects", std::move(objects)}};
}

core::errors::Result<json> create_cube(SceneDocument& document, const json& params) {
    const double size = params.at("size").get<double>();
    if (!(size > 0.0)) {
        return handler_error("size must be positive", "invalid_size");
    }

    const json& location = params.at("location");
    if (location.size() != 3 || !location[0].is_number() || !location[1].is_number() ||
        !location[2].is_number()) {
        return shape_error("create_cube: location must be [x, y, z]", "param_type_mismatch");
    }
    const Point3 origin{location[0].get<double>(), location[1].get<double>(),
                        location[2].get<double>()};

    const std::string name = params.value("name", std::string());
    const std::string layer = params.value("layer", std::string());
    const SceneObject& object = document.add_box(origin, size, name, layer);
    LOG_DEBUG("Scene: created " + object.id + " (" + object.short_id + ") on " + object.layer);

    return json{{"id", object.id},
                {"short_id", object.short_id},
                {"name", object.name},
                {"type", object.type},
                {"size", size},
                {"location", json::array({origin[0], origin[1], origin[2]})},
                {"layer", object.layer}};
}

core::errors::Result<json> add_object_metadata(SceneDocument& document, const json& params) {
    const std::string object_id = params.at("object_id").get<std::string>();
    SceneObject* object = document.find_object(object_id);
    if (object == nullptr) {
        return handler_error("Object not found: " + object_id, "object_not_found");
    }
    if (params.contains("name")) {
        object->name = params.at("name").get<std::string>();
    }
    if (params.contains("description")) {
        object->description = params.at("description").get<std::string>();
    }
    return json{{"status", "success"}, {"object", describe_object(*object)}};
}

core::errors::Result<std::uint32_t> script_timeout(const char* command, const json& params) {
    const std::int64_t timeout_ms = params.at("timeout_ms").get<std::int64_t>();
    if (timeout_ms <= 0 || timeout_ms > 3600000) {
        return shape_error(std::string(command) + ": timeout_ms must be between 1 and 3600000",
                           "param_out_of_range");
    }
    return static_cast<std::uint32_t>(timeout_ms);
}

// Runs the request and maps every way it can end short of a clean exit onto
// a handler error.
core::errors::Result<ScriptOutcome> run_checked(const ScriptRequest& request) {
    auto ran = run_script(request);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    auto& outcome = core::errors::get_value(ran);
    if (outcome.cancelled) {
        return handler_error("Script cancelled, host is shutting down", "script_cancelled");
    }
    if (outcome.timed_out) {
        return handler_error("Script timed out after " + std::to_string(request.timeout_ms) +
                                 " ms",
                             "script_timeout");
    }
    if (outcome.exit_code != 0) {
        std::string message = "Script exited with code " + std::to_string(outcome.exit_code);
        if (!outcome.stderr_text.empty()) {
            message += ": " + tail(outcome.stderr_text);
        }
        return handler_error(std::move(message), "script_failed");
    }
    return std::move(outcome);
}

core::errors::Result<json> execute_code(const ScriptContext& context, const json& params) {
    auto timeout = script_timeout("execute_code", params);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }

    ScriptRequest request;
    request.code = params.at("code").get<std::string>();
    request.working_directory = context.directory;
    request.timeout_ms = core::errors::get_value(timeout);
    request.cancel_token = context.cancel_token;

    auto ran = run_checked(request);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    const auto& outcome = core::errors::get_value(ran);
    return json{{"success", true},
                {"exit_code", outcome.exit_code},
                {"stdout", outcome.stdout_text},
                {"stderr", outcome.stderr_text},
                {"duration_ms", outcome.duration_ms}};
}

core::errors::Result<json> viewport_image(const SceneDocument& document, const json& params) {
    ViewportOptions options;
    if (params.contains("layer")) {
        options.layer = params.at("layer").get<std::string>();
    }
    options.show_annotations = params.at("show_annotations").get<bool>();
    options.max_size = params.at("max_size").get<std::int64_t>();

    auto captured = capture_viewport(document, options);
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }
    const auto& image = core::errors::get_value(captured);

    json annotations = json::array();
    for (const auto& annotation : image.annotations) {
        annotations.push_back({{"id", annotation.object_id},
                               {"short_id", annotation.short_id},
                               {"text", annotation.text},
                               {"pixel", json::array({annotation.x, annotation.y})}});
    }
    LOG_DEBUG("Scene: captured " + std::to_string(image.width) + "x" +
              std::to_string(image.height) + " viewport with " +
              std::to_string(annotations.size()) + " annotations");

    return json{{"type", "image"},
                {"source", {{"type", "base64"},
                            {"media_type", "image/x-portable-pixmap"},
                            {"data", base64_encode(encode_ppm(image))}}},
                {"view", "top"},
                {"width", image.width},
                {"height", image.height},
                {"annotations", std::move(annotations)}};
}

core::errors::Result<json> gh_get_context(const NodeGraph& graph, const json& params) {
    if (!graph.is_open()) {
        return handler_error("No active node-graph definition", "no_definition");
    }
    if (params.contains("description")) {
        LOG_INFO("Graph: context requested: " + params.at("description").get<std::string>());
    }
    return json{{"graph", graph.context()},
                {"component_count", graph.component_count()},
                {"node_count", graph.nodes().size()}};
}

core::errors::Result<json> gh_execute_code(const NodeGraph& graph, const ScriptContext& context,
                                           const json& params) {
    auto timeout = script_timeout("gh_execute_code", params);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }
    const std::string description = params.at("description").get<std::string>();
    LOG_INFO("Graph: executing code: " + description);

    ScriptRequest request;
    request.code = params.at("code").get<std::string>();
    request.working_directory = context.directory;
    request.timeout_ms = core::errors::get_value(timeout);
    request.cancel_token = context.cancel_token;
    request.stdin_text = graph.is_open() ? graph.context().dump() : "{}";

    auto ran = run_checked(request);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    const auto& outcome = core::errors::get_value(ran);

    // The script's stdout is its result: JSON when it parses, text otherwise.
    const std::string printed = trim(outcome.stdout_text);
    json result = "Code executed successfully";
    if (!printed.empty()) {
        json parsed = json::parse(printed, nullptr, false);
        result = parsed.is_discarded() ? json(printed) : std::move(parsed);
    }
    return json{{"result", std::move(result)},
                {"description", description},
                {"duration_ms", outcome.duration_ms}};
}

core::errors::Result<json> render_scene(const SceneDocument& document,
                                        const core::config::SecretStore& secrets,
                                        const json& params) {
    auto token = secrets.get(kRenderTokenKey);
    if (!token) {
        token = secrets.get("REPLICATE_TOKEN");
    }
    if (!token) {
        return handler_error(std::string("render_scene needs ") + kRenderTokenKey +
                                 " in the secrets file",
                             "missing_credential");
    }

    const std::int64_t width = params.at("width").get<std::int64_t>();
    const std::int64_t height = params.at("height").get<std::int64_t>();
    if (width <= 0 || height <= 0 || width > 4096 || height > 4096) {
        return shape_error("render_scene: width and height must be between 1 and 4096",
                           "param_out_of_range");
    }

    json input = {{"prompt", params.at("prompt")}, {"width", width}, {"height", height}};
    if (params.contains("seed")) {
        input["seed"] = params.at("seed");
    }

    // The request is staged here; the credential is attached by the sender
    // and never placed in the payload.
    return json{{"status", "prepared"},
                {"endpoint", kRenderEndpoint},
                {"version", kRenderModel},
                {"input", std::move(input)},
                {"credential_present", true},
                {"scene", {{"objects_count", document.objects().size()},
                           {"layers_count", document.layers().size()}}}};
}

}  // namespace

json describe_object(const SceneObject& object) {
    return json{{"id", object.id},
                {"short_id", object.short_id},
                {"created_at", object.created_at},
                {"name", object.name},
                {"description", object.description},
                {"type", object.type},
                {"layer", object.layer},
                {"bbox", bbox_corners(object)}};
}

core::errors::Result<registry::CommandRegistry> build_scene_registry(
    SceneDocument& document, NodeGraph& graph, const core::config::SecretStore& secrets,
    std::filesystem::path script_directory, std::shared_ptr<std::atomic_bool> cancel_token) {
    std::unordered_map<std::string, CommandHandler> handlers;
    const ScriptContext scripts{std::move(script_directory), std::move(cancel_token)};

    handlers["get_simple_info"] = [&document](const json&) {
        return get_simple_info(document);
    };
    handlers["get_scene_info"] = [&document](const json&) {
        return get_scene_info(document);
    };
    handlers["get_layers"] = [&document](const json&) {
        return get_layers(document);
    };
    handlers["get_objects_with_metadata"] = [&document](const json& params) {
        return get_objects_with_metadata(document, params);
    };
    handlers["create_cube"] = [&document](const json& params) {
        return create_cube(document, params);
    };
    handlers["add_object_metadata"] = [&document](const json& params) {
        return add_object_metadata(document, params);
    };
    handlers["execute_code"] = [scripts](const json& params) {
        return execute_code(scripts, params);
    };
    handlers["render_scene"] = [&document, &secrets](const json& params) {
        return render_scene(document, secrets, params);
    };
    handlers["capture_viewport"] = [&document](const json& params) {
        return viewport_image(document, params);
    };
    handlers["gh_get_context"] = [&graph](const json& params) {
        return gh_get_context(graph, params);
    };
    handlers["gh_execute_code"] = [&graph, scripts](const json& params) {
        return gh_execute_code(graph, scripts, params);
    };

    return registry::bind_handlers(registry::host_command_specs(), std::move(handlers));
}

}  // namespace hostbridge::host
