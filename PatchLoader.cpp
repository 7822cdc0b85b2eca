// PatchLoader.cpp
#include "PatchLoader.hpp"
#include "Log.hpp"
#include <fstream>

namespace BlockFlow {

namespace {

std::string requireString(const nlohmann::json& j, const char* key, const char* what) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        throw PatchError(fmt::format("{} is missing string field '{}'", what, key));
    }
    return j[key].get<std::string>();
}

std::vector<Port> portsFromJson(const nlohmann::json& j, PortDirection direction) {
    std::vector<Port> ports;
    if (j.is_null()) return ports;
    if (!j.is_array()) throw PatchError("port list must be an array");
    for (const auto& pj : j) {
        Port port;
        port.id = requireString(pj, "id", "port");
        port.name = pj.value("name", port.id);
        port.direction = direction;
        try {
            port.type = parsePortType(pj.value("type", std::string("any")));
        } catch (const std::invalid_argument& e) {
            throw PatchError(e.what());
        }
        if (pj.contains("paramTarget") && pj["paramTarget"].is_string()) {
            port.paramTarget = pj["paramTarget"].get<std::string>();
        }
        ports.push_back(std::move(port));
    }
    return ports;
}

} // namespace

Value valueFromJson(const nlohmann::json& j) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_array()) {
        std::vector<double> list;
        for (const auto& e : j) {
            // step patterns are often written as booleans
            if (e.is_number()) list.push_back(e.get<double>());
            else if (e.is_boolean()) list.push_back(e.get<bool>() ? 1.0 : 0.0);
            else throw PatchError("list values must contain only numbers or booleans");
        }
        return list;
    }
    throw PatchError("unsupported value: " + j.dump());
}

BlockDefinition definitionFromJson(const nlohmann::json& j) {
    BlockDefinition def;
    def.id = requireString(j, "id", "definition");
    def.name = j.value("name", def.id);
    def.behaviorId = j.value("behavior", std::string());
    def.runsAtAudioRate = j.value("runsAtAudioRate", false);
    def.forwardsInputsToNode = j.value("forwardsInputsToNode", false);
    const std::string kind = j.value("processorKind", std::string("native"));
    if (kind == "native") def.processorKind = ProcessorKind::Native;
    else if (kind == "custom") def.processorKind = ProcessorKind::Custom;
    else throw PatchError("unknown processorKind '" + kind + "' in definition " + def.id);
    def.inputs = portsFromJson(j.value("inputs", nlohmann::json()), PortDirection::Input);
    def.outputs = portsFromJson(j.value("outputs", nlohmann::json()), PortDirection::Output);
    if (j.contains("parameters")) {
        for (const auto& pj : j["parameters"]) {
            ParameterSpec spec;
            spec.id = requireString(pj, "id", "parameter");
            spec.defaultValue = valueFromJson(pj.value("default", nlohmann::json()));
            def.parameters.push_back(std::move(spec));
        }
    }
    return def;
}

PatchSummary loadPatch(const nlohmann::json& json, BlockStore& store) {
    if (!json.is_object()) throw PatchError("patch must be a JSON object");
    PatchSummary summary;
    try {
        if (json.contains("definitions")) {
            for (const auto& dj : json["definitions"]) {
                store.addDefinition(definitionFromJson(dj));
                ++summary.definitions;
            }
        }
        if (json.contains("instances")) {
            for (const auto& ij : json["instances"]) {
                const std::string defId = requireString(ij, "definition", "instance");
                const InstanceId id = store.addInstance(defId, ij.value("name", std::string()),
                                                        ij.value("id", std::string()));
                if (ij.contains("parameters")) {
                    if (!ij["parameters"].is_object()) throw PatchError("parameters of " + id + " must be an object");
                    for (const auto& param : ij["parameters"].items()) {
                        store.setParameter(id, param.key(), valueFromJson(param.value()));
                    }
                }
                ++summary.instances;
            }
        }
        if (json.contains("connections")) {
            for (const auto& cj : json["connections"]) {
                Connection conn;
                conn.id = cj.value("id", std::string());
                conn.fromInstance = requireString(cj, "fromInstance", "connection");
                conn.fromPort = requireString(cj, "fromPort", "connection");
                conn.toInstance = requireString(cj, "toInstance", "connection");
                conn.toPort = requireString(cj, "toPort", "connection");
                store.addConnection(std::move(conn));
                ++summary.connections;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw PatchError(std::string("malformed patch: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw PatchError(e.what());
    }
    log::info("PatchLoader", "loaded {} definitions, {} instances, {} connections", summary.definitions,
              summary.instances, summary.connections);
    return summary;
}

PatchSummary loadPatchFile(const std::string& path, BlockStore& store) {
    std::ifstream f(path);
    if (!f.good()) throw PatchError("Could not find patch file: " + path);
    nlohmann::json json;
    try {
        f >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw PatchError(path + ": " + e.what());
    }
    return loadPatch(json, store);
}

} // namespace BlockFlow
