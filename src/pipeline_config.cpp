#include "signalflow/pipeline_config.h"

#include <json/json.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace signalflow {
namespace {

std::string SerializeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

bool Fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

bool ReadCount(const Json::Value& object, const char* key, bool allowZero,
               std::size_t* value, std::string* error) {
    if (!object.isMember(key)) {
        return true;
    }
    const Json::Value& node = object[key];
    // isInt64 also rejects integral values asInt64 would throw on.
    if (!node.isInt64() || node.asInt64() < (allowZero ? 0 : 1)) {
        return Fail(error, std::string("'") + key + "' must be an integer >= " + (allowZero ? "0" : "1"));
    }
    *value = static_cast<std::size_t>(node.asInt64());
    return true;
}

bool ReadString(const Json::Value& object, const char* key, std::string* value, std::string* error) {
    if (!object.isMember(key)) {
        return true;
    }
    if (!object[key].isString() || object[key].asString().empty()) {
        return Fail(error, std::string("'") + key + "' must be a non-empty string");
    }
    *value = object[key].asString();
    return true;
}

bool ReadBool(const Json::Value& object, const char* key, bool* value, std::string* error) {
    if (!object.isMember(key)) {
        return true;
    }
    if (!object[key].isBool()) {
        return Fail(error, std::string("'") + key + "' must be a boolean");
    }
    *value = object[key].asBool();
    return true;
}

bool PopulateSignalConfig(const Json::Value& node, SignalConfig* signal, std::string* error) {
    if (!node.isObject()) {
        return Fail(error, "'signal' must be an object");
    }
    if (!ReadCount(node, "left_lookback", true, &signal->leftLookback, error) ||
        !ReadCount(node, "right_lookback", true, &signal->rightLookback, error) ||
        !ReadCount(node, "proximity_window", true, &signal->proximityWindow, error)) {
        return false;
    }
    if (node.isMember("change_penalty")) {
        if (!node["change_penalty"].isNumeric()) {
            return Fail(error, "'change_penalty' must be a number");
        }
        signal->changePenalty = node["change_penalty"].asDouble();
    }
    if (node.isMember("change_model")) {
        if (!node["change_model"].isString()) {
            return Fail(error, "'change_model' must be a string");
        }
        try {
            signal->changeModel = parse_cost_model(node["change_model"].asString());
        } catch (const std::invalid_argument& e) {
            return Fail(error, e.what());
        }
    }
    return signal->validate(error);
}

bool PopulateConfigFromJson(const Json::Value& root, PipelineConfig* config, std::string* error) {
    if (!config) {
        return Fail(error, "Config pointer is null.");
    }
    if (!root.isObject()) {
        return Fail(error, "Config JSON must be an object.");
    }

    PipelineConfig parsed;
    if (!ReadString(root, "preset", &parsed.preset, error)) {
        return false;
    }
    try {
        parsed.signal = SignalConfig::preset(parsed.preset);
    } catch (const std::invalid_argument& e) {
        return Fail(error, e.what());
    }
    if (root.isMember("signal") && !PopulateSignalConfig(root["signal"], &parsed.signal, error)) {
        return false;
    }

    if (root.isMember("solver")) {
        const Json::Value& solver = root["solver"];
        if (!solver.isObject()) {
            return Fail(error, "'solver' must be an object");
        }
        if (!ReadCount(solver, "min_size", false, &parsed.solver.min_size, error) ||
            !ReadCount(solver, "jump", false, &parsed.solver.jump, error)) {
            return false;
        }
    }

    if (!ReadString(root, "timestamp_column", &parsed.timestamp_column, error) ||
        !ReadString(root, "timestamp_format", &parsed.timestamp_format, error) ||
        !ReadString(root, "close_column", &parsed.close_column, error) ||
        !ReadString(root, "output_column", &parsed.output_column, error) ||
        !ReadBool(root, "technical_signals", &parsed.technical_signals, error) ||
        !ReadString(root, "data_directory", &parsed.data_directory, error) ||
        !ReadString(root, "symbols_file", &parsed.symbols_file, error) ||
        !ReadString(root, "symbol_column", &parsed.symbol_column, error) ||
        !ReadBool(root, "parallel", &parsed.parallel, error) ||
        !ReadCount(root, "recent_limit", true, &parsed.recent_limit, error) ||
        !ReadString(root, "output_path", &parsed.output_path, error)) {
        return false;
    }

    if (root.isMember("symbols")) {
        const Json::Value& symbols = root["symbols"];
        if (!symbols.isArray()) {
            return Fail(error, "'symbols' must be an array of strings");
        }
        for (const auto& symbol : symbols) {
            if (!symbol.isString() || symbol.asString().empty()) {
                return Fail(error, "'symbols' must be an array of strings");
            }
            parsed.symbols.push_back(symbol.asString());
        }
    }

    if (root.isMember("since") && !root["since"].isNull()) {
        if (!root["since"].isString()) {
            return Fail(error, "'since' must be a date string");
        }
        parsed.since = ParseUtcDateTime(root["since"].asString());
        if (!parsed.since) {
            return Fail(error, "Invalid 'since' date: " + root["since"].asString());
        }
    }

    *config = std::move(parsed);
    if (error) {
        error->clear();
    }
    return true;
}

}  // namespace

std::string PipelineConfig::ToJsonString() const {
    Json::Value root(Json::objectValue);
    root["preset"] = preset;

    Json::Value signalNode(Json::objectValue);
    signalNode["left_lookback"] = static_cast<Json::UInt64>(signal.leftLookback);
    signalNode["right_lookback"] = static_cast<Json::UInt64>(signal.rightLookback);
    signalNode["change_penalty"] = signal.changePenalty;
    signalNode["change_model"] = to_string(signal.changeModel);
    signalNode["proximity_window"] = static_cast<Json::UInt64>(signal.proximityWindow);
    root["signal"] = signalNode;

    Json::Value solverNode(Json::objectValue);
    solverNode["min_size"] = static_cast<Json::UInt64>(solver.min_size);
    solverNode["jump"] = static_cast<Json::UInt64>(solver.jump);
    root["solver"] = solverNode;

    root["timestamp_column"] = timestamp_column;
    root["timestamp_format"] = timestamp_format;
    root["close_column"] = close_column;
    root["output_column"] = output_column;
    root["technical_signals"] = technical_signals;
    root["data_directory"] = data_directory;

    Json::Value symbolsNode(Json::arrayValue);
    for (const auto& symbol : symbols) {
        symbolsNode.append(symbol);
    }
    root["symbols"] = symbolsNode;
    if (!symbols_file.empty()) {
        root["symbols_file"] = symbols_file;
    }
    root["symbol_column"] = symbol_column;

    root["parallel"] = parallel;
    root["recent_limit"] = static_cast<Json::UInt64>(recent_limit);
    root["since"] = since ? Json::Value(FormatUtcDateTime(*since)) : Json::Value(Json::nullValue);
    root["output_path"] = output_path;
    return SerializeJson(root);
}

std::optional<int64_t> ParseUtcDateTime(const std::string& text) {
    for (const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d"}) {
        std::tm tm{};
        std::istringstream in(text);
        in >> std::get_time(&tm, format);
        if (in.fail()) {
            continue;
        }
        in >> std::ws;
        if (!in.eof()) {
            continue;
        }
        return static_cast<int64_t>(timegm(&tm));
    }
    return std::nullopt;
}

std::string FormatUtcDateTime(int64_t unix_seconds, const char* format) {
    std::time_t tt = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

bool ParsePipelineConfig(const std::string& text, PipelineConfig* config, std::string* error) {
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Fail(error, errs.empty() ? "Failed to parse config JSON." : errs);
    }
    return PopulateConfigFromJson(root, config, error);
}

bool LoadPipelineConfig(const std::filesystem::path& file_path, PipelineConfig* config, std::string* error) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        return Fail(error, "Unable to open config file '" + file_path.string() + "' for reading.");
    }
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Fail(error, errs.empty()
            ? "Failed to parse config JSON at '" + file_path.string() + "'."
            : errs);
    }
    return PopulateConfigFromJson(root, config, error);
}

} // namespace signalflow
