#ifndef ARGPARSER_HPP
#define ARGPARSER_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fmutex {

class argparser {
  struct option {
    std::string value;
    std::string default_value;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _values;
  std::string _env_prefix;
  std::string _command;
  size_t _stop_at_value = 0;

 public:
  argparser();

  // Parse the command line. Throws std::invalid_argument on unknown options
  // and missing values.
  void parse(int argc, char** argv);

  // Options added after this call fall back to <PREFIX>_<NAME> environment variables
  void set_env_prefix(const std::string& prefix);

  // Stop option parsing once count positional values have been seen. The
  // remaining arguments are kept verbatim as values.
  void set_stop_at_value(size_t count);

  void add_option(const std::string& name, const std::string& default_value);
  void add_option_alias(const std::string& name, const std::string& alias);
  void add_bool_option(const std::string& name);

  std::string get_option(const std::string& name) const;
  int get_option_int(const std::string& name) const;

  // Check if the option is present on command line
  bool has_option(const std::string& name) const;

  std::string get_value(size_t index) const;
  std::filesystem::path get_value_path(size_t index) const;

  // Returns the values from index to the end
  std::vector<std::string> values_from(size_t index) const;

  // Returns the number of values
  size_t size() const;

  // Returns the value at the given index
  std::string operator[](size_t index) const;

  // Returns argv[0]
  std::string command() const;
};

}  // namespace fmutex

#endif  // ARGPARSER_HPP
