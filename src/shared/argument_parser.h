#pragma once

#include <vector>
#include <string>
#include <optional>
#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <string_view>

class ArgumentParser {
public:
  ArgumentParser(const int &argc, char **argv)
  {
    std::copy(argv, argv + argc, std::back_inserter(args));
  }

  std::optional<std::string> get_string(const std::string_view &option_name) const
  {
    auto it = std::find(args.begin(), args.end(), option_name);
    if (it != args.end() && std::next(it) != args.end()) {
      return std::string(*std::next(it));
    }
    return std::optional<std::string>();
  }

  std::optional<bool> get_flag(const std::string_view &option_name) const
  {
    auto it = std::find(args.begin(), args.end(), option_name);
    if (it != args.end()) {
      return true;
    }
    return std::optional<bool>();
  }

  /*!
   * @brief First "--option" that is not in the known list, skipping the values
   *        that follow options listed as taking one.
   */
  std::optional<std::string> find_unknown(std::initializer_list<std::string_view> flags,
                                          std::initializer_list<std::string_view> options) const
  {
    for (size_t i = 1; i < args.size(); ++i) {
      const std::string_view arg = args[i];
      if (std::find(options.begin(), options.end(), arg) != options.end()) {
        ++i;
      } else if (std::find(flags.begin(), flags.end(), arg) == flags.end()) {
        return std::string(arg);
      }
    }
    return std::optional<std::string>();
  }

private:
  std::vector<std::string_view> args;
};
