#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace speechmaker::config {
namespace {

using google::protobuf::FieldDescriptor;
using google::protobuf::Message;

std::runtime_error BadKey(const std::string& key_path, const std::string& what) {
  return std::runtime_error("Invalid configuration: " + key_path + ": " + what);
}

std::string Join(const std::string& prefix, const std::string& key) {
  return prefix.empty() ? key : prefix + "." + key;
}

template <typename T>
T As(const YAML::Node& node, const std::string& key_path, const char* expected) {
  try {
    return node.as<T>();
  } catch (const YAML::Exception&) {
    throw BadKey(key_path, std::string("expected ") + expected + ", got '" + node.Scalar() + "'");
  }
}

void MergeMap(const YAML::Node& map, Message* message, const std::string& prefix);

void SetField(const YAML::Node& node, const FieldDescriptor* field, Message* message, const std::string& key_path) {
  const auto* reflection = message->GetReflection();

  if (field->is_repeated()) {
    throw BadKey(key_path, "lists are not supported");
  }

  if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
    if (node.IsNull()) {
      return;
    }
    if (!node.IsMap()) {
      throw BadKey(key_path, "expected a mapping");
    }
    MergeMap(node, reflection->MutableMessage(message, field), key_path);
    return;
  }

  // "key:" with no value keeps the default
  if (node.IsNull()) {
    return;
  }
  if (!node.IsScalar()) {
    throw BadKey(key_path, "expected a scalar value");
  }

  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING:
      reflection->SetString(message, field, node.Scalar());
      break;
    case FieldDescriptor::CPPTYPE_BOOL:
      reflection->SetBool(message, field, As<bool>(node, key_path, "true or false"));
      break;
    case FieldDescriptor::CPPTYPE_INT32:
      reflection->SetInt32(message, field, As<std::int32_t>(node, key_path, "an integer"));
      break;
    case FieldDescriptor::CPPTYPE_INT64:
      reflection->SetInt64(message, field, As<std::int64_t>(node, key_path, "an integer"));
      break;
    case FieldDescriptor::CPPTYPE_UINT32:
      if (!node.Scalar().empty() && node.Scalar().front() == '-') {
        throw BadKey(key_path, "must not be negative");
      }
      reflection->SetUInt32(message, field, As<std::uint32_t>(node, key_path, "a non-negative integer"));
      break;
    case FieldDescriptor::CPPTYPE_UINT64:
      if (!node.Scalar().empty() && node.Scalar().front() == '-') {
        throw BadKey(key_path, "must not be negative");
      }
      reflection->SetUInt64(message, field, As<std::uint64_t>(node, key_path, "a non-negative integer"));
      break;
    case FieldDescriptor::CPPTYPE_DOUBLE:
      reflection->SetDouble(message, field, As<double>(node, key_path, "a number"));
      break;
    case FieldDescriptor::CPPTYPE_FLOAT:
      reflection->SetFloat(message, field, As<float>(node, key_path, "a number"));
      break;
    case FieldDescriptor::CPPTYPE_ENUM: {
      const auto* value = field->enum_type()->FindValueByName(node.Scalar());
      if (value == nullptr) {
        throw BadKey(key_path, "unknown value '" + node.Scalar() + "'");
      }
      reflection->SetEnum(message, field, value);
      break;
    }
    default:
      throw BadKey(key_path, "unsupported field type");
  }
}

void MergeMap(const YAML::Node& map, Message* message, const std::string& prefix) {
  const auto* descriptor = message->GetDescriptor();

  for (const auto& entry : map) {
    const auto  key      = entry.first.as<std::string>();
    const auto  key_path = Join(prefix, key);
    const auto* field    = descriptor->FindFieldByName(key);
    if (field == nullptr) {
      field = descriptor->FindFieldByCamelcaseName(key);
    }
    if (field == nullptr) {
      throw BadKey(key_path, "unknown key");
    }
    SetField(entry.second, field, message, key_path);
  }
}

speechmaker::runtime::config::RuntimeConfig FromDocument(const YAML::Node& document) {
  speechmaker::runtime::config::RuntimeConfig config;
  if (!document || document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }
  MergeMap(document, &config, "");
  return config;
}

} // namespace

speechmaker::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw std::runtime_error("Config file not readable: " + path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(path + ": " + e.what());
  }

  try {
    return FromDocument(document);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

speechmaker::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Malformed YAML: ") + e.what());
  }
  return FromDocument(document);
}

std::string ConfigLoader::ResolvePath(const std::string& cli_path) {
  if (!cli_path.empty()) {
    return cli_path;
  }
  if (const char* env = std::getenv(kPathEnv); env != nullptr && *env != '\0') {
    return env;
  }
  return kDefaultPath;
}

} // namespace speechmaker::config
