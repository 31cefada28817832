#include "runtime/value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace agentic::runtime {

Value Value::from_string(std::string text) { return Value(Storage(std::move(text))); }

Value Value::from_number(const double number) { return Value(Storage(number)); }

Value Value::from_bool(const bool flag) { return Value(Storage(flag)); }

Value Value::from_agent(AgentRef agent) { return Value(Storage(std::move(agent))); }

Value Value::from_tools(ToolSet tools) { return Value(Storage(std::move(tools))); }

Value Value::from_mapping(Mapping mapping) {
    return Value(Storage(std::make_shared<const Mapping>(std::move(mapping))));
}

Value::Type Value::type() const {
    switch (data_.index()) {
        case 0: return Type::Null;
        case 1: return Type::String;
        case 2: return Type::Number;
        case 3: return Type::Boolean;
        case 4: return Type::Agent;
        case 5: return Type::Tools;
        default: return Type::Mapping;
    }
}

const std::string& Value::as_string() const { return std::get<std::string>(data_); }

double Value::as_number() const { return std::get<double>(data_); }

bool Value::as_bool() const { return std::get<bool>(data_); }

const AgentRef& Value::as_agent() const { return std::get<AgentRef>(data_); }

const ToolSet& Value::as_tools() const { return std::get<ToolSet>(data_); }

const Mapping& Value::as_mapping() const {
    return *std::get<std::shared_ptr<const Mapping>>(data_);
}

std::string format_number(const double number) {
    if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }
    std::ostringstream out;
    out << std::setprecision(15) << number;
    return out.str();
}

std::string Value::to_display() const {
    switch (type()) {
        case Type::Null:
            return "null";
        case Type::String:
            return as_string();
        case Type::Number:
            return format_number(as_number());
        case Type::Boolean:
            return as_bool() ? "true" : "false";
        case Type::Agent:
            return "<agent " + as_agent().name + ">";
        case Type::Tools: {
            std::string out = "{";
            const ToolSet& tools = as_tools();
            for (std::size_t i = 0; i < tools.size(); ++i) {
                out += i == 0 ? "" : ", ";
                out += tools[i].name;
                if (tools[i].targets.empty()) {
                    continue;
                }
                out += "{";
                for (std::size_t t = 0; t < tools[i].targets.size(); ++t) {
                    out += (t == 0 ? "" : ", ") + tools[i].targets[t].name;
                }
                out += "}";
            }
            return out + "}";
        }
        case Type::Mapping: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, value] : as_mapping().entries) {
                out += first ? "" : ", ";
                first = false;
                out += key + ": ";
                out += value.is(Type::String) ? "\"" + value.as_string() + "\"" : value.to_display();
            }
            return out + "}";
        }
        default:
            return "";
    }
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::Null:
            return true;
        case Type::String:
            return as_string() == other.as_string();
        case Type::Number:
            return as_number() == other.as_number();
        case Type::Boolean:
            return as_bool() == other.as_bool();
        case Type::Agent:
            return as_agent().id == other.as_agent().id;
        case Type::Tools: {
            const ToolSet& lhs = as_tools();
            const ToolSet& rhs = other.as_tools();
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (lhs[i].name != rhs[i].name || lhs[i].targets.size() != rhs[i].targets.size()) {
                    return false;
                }
                for (std::size_t t = 0; t < lhs[i].targets.size(); ++t) {
                    if (lhs[i].targets[t].id != rhs[i].targets[t].id) {
                        return false;
                    }
                }
            }
            return true;
        }
        case Type::Mapping: {
            const auto& lhs = as_mapping().entries;
            const auto& rhs = other.as_mapping().entries;
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (lhs[i].first != rhs[i].first || lhs[i].second != rhs[i].second) {
                    return false;
                }
            }
            return true;
        }
        default:
            return false;
    }
}

const Value* Mapping::find(const std::string& key) const {
    for (const auto& entry : entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const char* to_string(const Value::Type type) {
    switch (type) {
        case Value::Type::Null:    return "null";
        case Value::Type::String:  return "string";
        case Value::Type::Number:  return "number";
        case Value::Type::Boolean: return "boolean";
        case Value::Type::Agent:   return "agent";
        case Value::Type::Tools:   return "tools";
        case Value::Type::Mapping: return "mapping";
        default: return "unknown";
    }
}

}  // namespace agentic::runtime
