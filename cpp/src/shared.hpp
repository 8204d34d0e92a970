#pragma once
/**
 * @brief Shared functionality.
 */


#include <filesystem>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <exec.hpp>


namespace shared {

  // Environment variables
  extern const std::string home, config;

  // Definitions.
  using set = std::set<std::string>;
  using vector = std::vector<std::string>;
  using list = std::initializer_list<std::string_view>;


  /**
   * @brief A failed external command.
   * Thrown when a command whose output the build cannot do without
   * fails to run, or produces nothing usable.
   */
  class command_error : public std::runtime_error {
    private:
      std::string cmd, out;

      static std::string format(const std::string& what, const std::string& cmd, const std::string& out) {
        std::stringstream msg;
        msg << what << "\ncommand: " << cmd << "\noutput:\n" << out;
        return msg.str();
      }

    public:

      /**
       * @brief Construct a command error.
       * @param what: A description of what failed.
       * @param command: The command line, joined.
       * @param output: The captured output of the command, if any.
       */
      command_error(const std::string& what, const std::string& command, const std::string& output = "")
        : std::runtime_error(format(what, command, output)), cmd(command), out(output) {}

      const std::string& command() const {return cmd;}
      const std::string& output() const {return out;}
  };


  /**
   * @brief A Temporary Directory
   * A directory that destroys itself upon falling out of scope.
   */
  class TemporaryDirectory {
    private:
      static std::random_device dev;
      static std::mt19937 prng;
      static std::uniform_int_distribution<uint64_t> rand;

      // The path, and the name
      std::string path;
      std::string name;

      /**
       * @brief Generate a temporary path.
       * @param parent: The directory to create the temp dir.
       * @param prefix: A prefix to put before the random identifier on the directory name.
       */
      void generate(const std::string_view& parent, const std::string_view& prefix) {
        path.clear();
        path.reserve(parent.length() + prefix.length() + 17);
        path.append(parent); if (!parent.ends_with('/')) path += '/';

        std::stringstream name_stream;
        if (!prefix.empty()) name_stream << prefix << '-';
        name_stream << std::hex << rand(prng);
        name = name_stream.str();
        path += name;
      }

    public:

    /**
     * @brief Construct a Temporary Directory.
     * @param parent: The path to create the directory at.
     * @param prefix: A prefix for the name.
     * @note The directory deletes itself after falling out of scope.
     */
    TemporaryDirectory(
        const std::string& parent = std::filesystem::temp_directory_path(),
        const std::string_view& prefix = "sofpack"
    ) {
      do {
        generate(parent, prefix);
      } while (std::filesystem::exists(path));
      std::filesystem::create_directories(path);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    // Obliterate the directory.
    ~TemporaryDirectory() {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
    }

    /**
     * @brief Return the path to the directory.
     * @returns The path
     */
    const std::string& get_path() const {return path;}

    /**
     * @brief Create a subdirectory/file in the temp dir.
     * @param name: The name of the new entity.
     * @param dir: Whether the entity is a directory, and thus should be
     * created.
     * @returns The path to the new entity.
     */
    std::string sub(const std::string& name, const bool& dir = false) const {
      const auto new_path = path + "/" + name;
      if (dir) std::filesystem::create_directories(new_path);
      return new_path;
    }

    /**
     * @brief Return the name of the directory, excluding the path.
     */
    const std::string& get_name() const {return name;}
  };

  /**
   * @brief Log output to console, if verbose.
   * @param msg: A list of strings to be printed.
   * @param level: The verbosity needed for the message to print.
   */
  void log(const list& msg, const std::string& level="log");


  /**
   * @brief Print a warning to stderr.
   * @param msg: A list of strings to be printed.
   * @note Warnings are always printed, and counted. See warnings().
   */
  void warning(const list& msg);


  /**
   * @brief The number of warnings issued so far.
   */
  uint_fast32_t warnings();


  /**
   * @brief Extend a container in place.
   * @tparam T: The container type for both dest and source.
   * @param dest: The container to extend.
   * @param source: The values to pull from.
   */
  template <class T = list> void extend(vector& dest, T source);


  /**
   * @brief Join a vector into a string.
   * @tparam The container. Defaults to vector of strings, but can also be set.
   * @param list: The list to join.
   * @param joiner: The character to join each member.
   * @returns: The joined string.
   */
  template <class T = vector> std::string join(const T& list, const char& joiner =  ' ');


  /**
   * @brief Trim characters from the front and end of a string.
   * @param in: The input string.
   * @param to_strip: The list of characters to trim.
   * @returns The trimmed string.
   * @note trim only removes from the front and end, stopping after
   * encountered a non-to_strip character.
   */
  template <typename T = char> std::string trim(const std::string_view& in, const T& to_strip);


  /**
   * @brief Resolve wildcard patterns.
   * @param pattern: The pattern to resolve
   * @param path: The path to look in
   * @param args: Any additional arguments to find.
   * @returns: All unique matches.
   * @throws std::runtime_error if find cannot be run.
   */
  set wildcard(const std::string_view& pattern, const std::string_view& path, const list& args = {});


  /**
   * @brief Hash the contents of a file.
   * @param path: The file to hash. Symlinks are followed.
   * @returns The hex digest.
   * @throws std::runtime_error if the file cannot be read.
   */
  std::string hash_file(const std::filesystem::path& path);
}
