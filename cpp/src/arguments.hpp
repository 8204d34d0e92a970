#pragma once
/**
 * @brief A general purpose, flexible command-line argument handler.
 * This file includes definitions to create a command-line argument handler. `--switches` and `-s`
 * formatting is supported, as is specifying multiple short-switches together a la `-vv`. Additionally,
 * lists are supported, and values can be provided either with an = key, a space, or with multiple invocations
 * of the switch for lists. Lists may carry defaults, which are replaced by the first value the user provides.
 */

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include "shared.hpp"


namespace arg {

  /**
   * Arguments passed to Argument.
   */
  typedef struct config {
    std::string l_name;
    std::string s_name;
    std::string def = "false";
    shared::vector valid = {};
    shared::vector defaults = {};
    bool must_set = false;
    bool list = false;
    uint_fast8_t position = -1;
    std::string help;
  } config;


  /**
   * @brief A command-line argument.
   */
  class Arg {
    private:

      // Long name, like --verbose, short-name, like -v
      std::string long_name, short_name;

      // The current value, and the default.
      std::string value, def;

      // The help string!
      std::string help;

      bool list = false;

      // The set of valid values. Empty means any value is acceptable.
      // list_val is only used when list=true.
      shared::set valid = {}, list_val = {}, list_def = {};
      shared::vector order = {};

      // If the argument is mandatory, it must be set.
      // Defaulted lists drop their defaults on the first user value.
      bool mandatory = false, set = false, defaulted = false;

      // Set a mandatory position for the argument.
      uint_fast8_t positional = -1;

      // Special logic to parse values.
      std::function<std::string(const std::string_view&)> parser;


      /**
       * @brief Digest a key and value.
       * @param key: The key, which needs to be long_name or short_name to be consumed.
       * @param val: The new value, which must be valid.
       * @returns Whether the keypair was consumed.
       * @throws std::runtime_error if the value is not valid for this argument.
       */
      bool digest_keypair(const std::string_view& key, const std::string_view& val) {

        // Ensure the key matches this argument
        if (key != long_name && (short_name.empty() || key != short_name)) return false;

        // Using ! sets value to their default values, and restores the list defaults.
        if (val == "!") {
          value = def;
          list_val = list_def;
          defaulted = !list_def.empty();
          return true;
        }

        if (list) {

          // If our key already has multiple values, split and handle separately.
          if (val.contains(',')) {
            for (const auto& x : container::init<shared::vector>(container::split<shared::vector, char>, val, ',', false))
              digest_keypair(key, x);
            return true;
          }
          if (!accepts(val)) throw std::runtime_error("Invalid value for " + long_name + ": " + std::string(val));

          if (defaulted) {
            list_val.clear();
            defaulted = false;
          }
          list_val.emplace(parser(val));
          return true;
        }

        if (!accepts(val)) throw std::runtime_error("Invalid value for " + long_name + ": " + std::string(val));
        value = parser(val);
        return true;
      }


      /**
       * @brief Check a value against the valid set.
       * @param val: The value.
       * @returns Whether it can be stored.
       */
      bool accepts(const std::string_view& val) const {
        return valid.size() <= 1 || valid.contains(std::string(val));
      }


      /**
       * @brief Increment the argument.
       * @note Arguments are all strings, but we can treat them like numbers
       * by simply 'incrementing' the argument to successive valid values. For example,
       * --verbose is a numerical argument with multiple values, {"false", "log", "debug"}. The Argument
       * will increment from false, to log, if we just pass --verbose without an argument.
       * Therefore, we can do -vv and get a value of 2 through level().
       */
      void increment() {
        auto i = level();
        if (i + 1u < order.size())
          value = order[i + 1];
        else
          std::cerr << long_name << ": Already at highest level!" << std::endl;
      }


      /**
       * @brief Return the level for a corresponding valid value.
       * @param val: The value.
       */
      uint_fast8_t level(const std::string_view& val) const {return std::find(order.begin(), order.end(), val) - order.begin();}


    public:


      /**
      * @brief Construct an argument.
      * @param c: The configuration structure.
      * @param handler: The lambda for parsing values.
      */
      Arg(
        const config& c,
        const std::function<std::string(const std::string_view&)>& handler = [](const std::string_view& value){return std::string(value);}
      ) {

        long_name = c.l_name;
        short_name = c.s_name;
        help = c.help;
        parser = handler;

        // Parse the defaults.
        value = parser(c.def);
        def = value;

        // Construct the valid field.
        // The default value will always be valid, and can be excluded from the passed
        // valid values.
        valid = {c.def}; order = {c.def};
        for (const auto& v : c.valid) {
          if (v != c.def) {valid.emplace(v); order.emplace_back(v);}
        }
        mandatory = c.must_set;
        list = c.list;
        positional = c.position;

        for (const auto& v : c.defaults) list_def.emplace(parser(v));
        list_val = list_def;
        defaulted = !list_def.empty();
      }


      /**
       * @brief Digest arguments.
       * @param args: The list of command line arguments.
       * @param x: The current position within the list.
       * @returns: Whether the current argument was consumed.
       */
      bool digest(const shared::vector& args, uint_fast8_t& x) {

        // Get the value
        const auto& key = args[x];
        auto ret = false;

        if (key == "--help" || key == "-h") throw std::runtime_error("Help!");
        if (key == "--version" || key == "-V") throw std::runtime_error("Version");

        // A bare -- is a separator.
        if (key == "--") return true;

        // If we have an equal, it's `key=value`
        if (key.starts_with("-") && key.contains("=")) {
          auto split = key.find('=');
          ret = digest_keypair(key.substr(0, split), key.substr(split + 1));
        }

        // If we have a short name, digest each character.
        // There is no support for values for short names.
        else if (key.length() > 2 && key[0] == '-' && key[1] != '-') {
          if (short_name.length() == 2) {
            for (uint_fast8_t y = 1; y < key.length(); ++y) {
              if (key[y] == short_name[1]) {
                increment();
                ret = true;
              }
            }
          }
        }

        // / Otherwise, if the next argument isn't a switch, we have `key value`
        // Leveled switches only take the next argument if it is one of their levels.
        else if (!key.empty() && (key == long_name || (!short_name.empty() && key == short_name))) {
          const auto leveled = def == "false" && order.size() > 1;
          if (x + 1 != args.size() && !args[x + 1].empty() && args[x + 1][0] != '-' && (!leveled || accepts(args[x + 1]))) {
            if (list) {
              while (++x < args.size() && !args[x].empty() && args[x][0] != '-')
                digest_keypair(key, args[x]);
              ret = true;
              --x;
            }
            else ret = digest_keypair(key, args[++x]);
          }

          else if (list) throw std::runtime_error("List argument requires values: " + long_name);

          // If there are stages to the switch, increment it.
          else if (order.size() > 1) {
            increment();
            ret = true;
          }

          else throw std::runtime_error("Argument requires a value: " + long_name);
        }

        // If the position matches, or the positional is still unset, assume the key is the value.
        else if (!key.starts_with("-") && (positional == x || (positional != static_cast<uint_fast8_t>(-1) && !set))) {
          value = parser(key);
          ret = true;
        }

        // Update the set flag.
        set |= ret;
        return ret;
      }


      /**
       * @brief Check mandatory arguments.
       * @throws std::runtime_error if a mandatory argument was never set.
       */
      void update() const {
        if (mandatory && !set) throw std::runtime_error("Missing mandatory argument: " + long_name);
      }


      /**
       * @brief Get the help text for the argument.
       * @returns The string.
       */
      std::string get_help() const {
        std::stringstream help_text;
        help_text << long_name;
       if (!short_name.empty()) help_text << '/' << short_name;
       help_text << ' ';

        if (list) help_text << '[' << "VAL" << ',';
        if (order.size() > 1) {
          help_text << '{';
          for (const auto& v : order) {
            help_text << v;
            if (v != *std::prev(order.end())) help_text << ',';
          }
          help_text << '}';
        }
        if (list) help_text << "...]";

        help_text << "\n\t" << help << '\n';
        return help_text.str();
      }


      /**
       * @brief Get the stored value.
       * @returns The value.
       * @throws std::runtime_error if the argument is a list, use get_list() instead.
       */
      const std::string& get() const {
        if (list) throw std::runtime_error("Not a discrete value: " + long_name);
        return value;
      }


      /**
       * @brief Emplace a value
       * @param val: The value to emplace.
       * @throws std::runtime_error if the valid is invalid.
       * @note For single value arguments, this overwrites the stored value. For lists,
       * it emplaces into the list if its valid.
       */
       void emplace(const std::string& val) {set |= digest_keypair(long_name, val);}


      /**
       * @brief Return whether the argument is a list.
       * @returns Whether the argument accepts multiple values.
       */
      const bool& is_list() const {return list;}


      /**
       * @brief Return the current level of the argument.
       * @returns The current level.
       */
      uint_fast8_t level() const {return level(value);}


      /**
       * @brief Return each unique value passed to the argument.
       * @returns The set.
       * @throws std::runtime_error if the argument is not a list.
       */
      const shared::set& get_list() const {
        if (!list) throw std::runtime_error("Argument must be a list: " + long_name);
        return list_val;
      }

      /**
       * @brief Return a set of all valid values.
       * @returns The set.
       */
      const shared::set& get_valid() const {return valid;}


      /**
       * @brief Return the position of the argument.
       * @returns The mandatory level.
       */
      const uint_fast8_t& position() const {return positional;}

      /**
       * @brief Return whether the argument was set.
       * @returns Whether the value differs from the default, or a list has values.
       */
      operator bool() const {return (list && !list_val.empty()) || (!list && value != def);}

      /**
       * @brief Check if the current value is underneath the provided.
       * @param val: The value to check.
       * @returns Whether the current value is less than the provided.
       */
      bool operator < (const std::string_view& val) const {return level(value) < level(val);}


      /**
       * @brief Check if the current value meets the provided.
       * @param val: The value to check.
       * @returns Whether the current value meets the provided.
       */
      bool operator >= (const std::string_view& val) const {return level(value) >= level(val);}
  };


  // Mapping of all switches.
  extern std::map<std::string, arg::Arg> switches;

  // Unknown arguments.
  extern shared::vector unknown;

  // The arguments.
  extern shared::vector args;


  // Helper functions.
  inline Arg& at(const std::string& key) {
    if (!switches.contains(key)) throw std::runtime_error("Invalid argument: " + key);
    else return switches.at(key);
  }
  inline const std::string& get(const std::string& key) {return at(key).get();}
  inline void emplace(const std::string& key, const std::string& val) {at(key).emplace(val);}
  inline uint_fast8_t level(const std::string& key) {return at(key).level();}
  inline const shared::set& list(const std::string& key) {return at(key).get_list();}
  inline const shared::set& valid(const std::string& key) {return at(key).get_valid();}
  inline const bool& is_list(const std::string& key) {return at(key).is_list();}


  /**
   * @brief The default configuration file.
   * @returns $XDG_CONFIG_HOME/sofpack/sofpack.conf
   */
  std::filesystem::path conf();


  /**
   * @brief Apply a KEY=VALUE configuration file as defaults.
   * @param path: The file. A missing file is not an error.
   * @note Invalid lines are reported and skipped.
   */
  void parse_conf(const std::filesystem::path& path);


  /**
   * @brief Parse command line arguments.
   * @param path: The configuration file to apply before the arguments.
   * @throws std::runtime_error on unknown or invalid arguments.
   * @note --help and --version print and exit.
   */
  void parse_args(const std::filesystem::path& path = conf());
}
