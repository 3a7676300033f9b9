#include "argparser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace fmutex {

argparser::argparser() {}

void argparser::parse(int argc, char** argv) {
  _command = argc > 0 ? argv[0] : "";

  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!options_done && _stop_at_value > 0 && _values.size() >= _stop_at_value) {
      options_done = true;
    }

    if (options_done || arg.size() < 2 || arg[0] != '-') {
      _values.push_back(arg);
      continue;
    }

    // -- ends option parsing
    if (arg == "--") {
      options_done = true;
      continue;
    }

    // --option=value
    size_t pos = arg.find('=');
    if (pos != std::string::npos) {
      std::string name = arg.substr(0, pos);
      std::string value = arg.substr(pos + 1);
      if (_options.find(name) == _options.end()) {
        throw std::invalid_argument("unknown option: " + name);
      }
      if (!_options[name]->has_value) {
        throw std::invalid_argument("option does not take a value: " + name);
      }
      _options[name]->value = value;
      continue;
    }

    // --option value
    if (_options.find(arg) == _options.end()) {
      throw std::invalid_argument("unknown option: " + arg);
    }

    if (_options[arg]->has_value) {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for option: " + arg);
      }
      _options[arg]->value = argv[++i];
    }
    else {
      _options[arg]->value = "true";
    }
  }
}

void argparser::set_env_prefix(const std::string& prefix) { _env_prefix = prefix; }

void argparser::set_stop_at_value(size_t count) { _stop_at_value = count; }

void argparser::add_option(const std::string& name, const std::string& default_value) {
  _options[name] = std::make_shared<option>(option{"", default_value, true});

  // Check if the option is set in the environment
  if (!_env_prefix.empty()) {
    // Replace - with _
    std::string env_name = _env_prefix + "_" + name.substr(2);
    std::replace(env_name.begin(), env_name.end(), '-', '_');

    // Convert to uppercase
    std::transform(env_name.begin(), env_name.end(), env_name.begin(), ::toupper);

    if (const char* env_value = std::getenv(env_name.c_str())) {
      _options[name]->value = env_value;
    }
  }
}

void argparser::add_option_alias(const std::string& name, const std::string& alias) {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  _options[alias] = _options[name];
}

void argparser::add_bool_option(const std::string& name) {
  _options[name] = std::make_shared<option>(option{"", "", false});
}

std::string argparser::get_option(const std::string& name) const {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  if (_options.at(name)->value.empty()) {
    return _options.at(name)->default_value;
  }
  return _options.at(name)->value;
}

int argparser::get_option_int(const std::string& name) const {
  std::string value = get_option(name);
  size_t end = 0;
  int result = 0;
  try {
    result = std::stoi(value, &end);
  }
  catch (const std::exception&) {
    throw std::invalid_argument("invalid value for option " + name + ": " + value);
  }
  if (end != value.size()) {
    throw std::invalid_argument("invalid value for option " + name + ": " + value);
  }
  return result;
}

bool argparser::has_option(const std::string& name) const {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  return !_options.at(name)->value.empty();
}

std::string argparser::get_value(size_t index) const {
  if (index >= _values.size()) {
    throw std::invalid_argument("index out of range");
  }
  return _values[index];
}

std::filesystem::path argparser::get_value_path(size_t index) const {
  return std::filesystem::absolute(get_value(index)).lexically_normal();
}

std::vector<std::string> argparser::values_from(size_t index) const {
  if (index >= _values.size()) {
    return {};
  }
  return std::vector<std::string>(_values.begin() + index, _values.end());
}

size_t argparser::size() const { return _values.size(); }

std::string argparser::operator[](size_t index) const { return get_value(index); }

std::string argparser::command() const { return _command; }

}  // namespace fmutex
