#include "registry/command_catalog.hpp"

namespace hostbridge::registry {

using nlohmann::json;

std::vector<CommandSpec> host_command_specs() {
    std::vector<CommandSpec> specs;

    specs.push_back({"get_simple_info",
                     "Host version, document path and model units.",
                     {}});

    specs.push_back({"get_scene_info",
                     "Object and layer summaries for the current document.",
                     {}});

    specs.push_back({"get_layers",
                     "All layers with colour, visibility, lock state and the current layer.",
                     {}});

    specs.push_back(
        {"get_objects_with_metadata",
         "Objects with their metadata, filtered by layer/name wildcards or short_id.",
         {{"filters", ParamType::Object, false, json::object(),
           "Keys: layer, name (both accept * and ?), short_id (exact)."},
          {"metadata_fields", ParamType::Array, false, json(),
           "Return only these fields for each object."}}});

    specs.push_back({"create_cube",
                     "Add an axis-aligned box to the document.",
                     {{"size", ParamType::Number, false, 1.0, "Edge length, must be > 0."},
                      {"location", ParamType::Array, false, json::array({0.0, 0.0, 0.0}),
                       "[x, y, z] of the minimum corner."},
                      {"name", ParamType::String, false, json(), "Object name."},
                      {"layer", ParamType::String, false, json(),
                       "Target layer, created when missing. Defaults to the current layer."}}});

    specs.push_back({"add_object_metadata",
                     "Stamp a name and description on an existing object.",
                     {{"object_id", ParamType::String, true, json(), "Object id."},
                      {"name", ParamType::String, false, json(), "New object name."},
                      {"description", ParamType::String, false, json(),
                       "Free-text description."}}});

    specs.push_back({"execute_code",
                     "Run arbitrary code in the host process through /bin/sh, "
                     "without any sandbox.",
                     {{"code", ParamType::String, true, json(), "Script text."},
                      {"timeout_ms", ParamType::Integer, false, 10000,
                       "Kill the script after this many milliseconds."}}});

    specs.push_back({"render_scene",
                     "Prepare an AI render request of the current scene for the inference API.",
                     {{"prompt", ParamType::String, true, json(), "Render prompt."},
                      {"width", ParamType::Integer, false, 1024, "Output width in pixels."},
                      {"height", ParamType::Integer, false, 1024, "Output height in pixels."},
                      {"seed", ParamType::Integer, false, json(), "Sampler seed."}}});

    specs.push_back({"capture_viewport",
                     "Top view of the document as a base64 image, with short_id markers.",
                     {{"layer", ParamType::String, false, json(),
                       "Only annotate objects on this layer."},
                      {"show_annotations", ParamType::Boolean, false, true,
                       "Mark each object and list its short_id."},
                      {"max_size", ParamType::Integer, false, 800,
                       "Longer image side in pixels, 16 to 4096."}}});

    specs.push_back({"gh_get_context",
                     "Component graph of the open node-graph definition, keyed by guid.",
                     {{"description", ParamType::String, false, json(),
                       "Why the context is requested."}}});

    specs.push_back({"gh_execute_code",
                     "Run code through /bin/sh with the node graph as JSON on stdin, "
                     "without any sandbox.",
                     {{"code", ParamType::String, true, json(), "Script text."},
                      {"description", ParamType::String, true, json(),
                       "Short summary of what the code does."},
                      {"timeout_ms", ParamType::Integer, false, 10000,
                       "Kill the script after this many milliseconds."}}});

    return specs;
}

}  // namespace hostbridge::registry
