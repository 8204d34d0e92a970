#include "arguments.hpp"


#ifndef VERSION
#define VERSION "Unknown"
#endif

using namespace shared;
using namespace exec;

namespace arg {

  vector unknown = {}, args;


  // All switches
  std::map<std::string, arg::Arg> switches = {

    // The binary to bundle.
    // You can either provide it via position 0, or through flags --target/-T
    {"target", arg::config{.l_name="--target", .s_name="-T", .def="", .must_set=true, .position=0, .help="The binary whose libraries are bundled. A path, or a filename found under --search-root"}},

    // Switches that just check if they are set.
    {"help", arg::config{.l_name="--help", .s_name="-h", .help="Print this message"}},
    {"version", arg::config{.l_name="--version", .s_name="-V", .help="Get the version"}},
    {"verbose", arg::config{.l_name="--verbose", .s_name="-v", .valid={"log", "debug"}, .help="Print verbose information"}},

    {"search_root", arg::config{
      .l_name="--search-root", .s_name="",
      .def="",
      .help="A directory searched recursively for an executable named --target",
    }},
    {"staging", arg::config{
      .l_name="--staging", .s_name="-s",
      .def="build_libs",
      .help="The staging directory. It is deleted and recreated on every run",
    }},
    {"destination", arg::config{
      .l_name="--destination", .s_name="-d",
      .def="lib",
      .help="The library directory within the package that every staged file is placed in",
    }},
    {"manifest", arg::config{
      .l_name="--manifest", .s_name="-o",
      .def="",
      .help="Write the bundling directives to this file, rather than standard output",
    }},
    {"format", arg::config{
      .l_name="--format", .s_name="-f",
      .def="add-binary",
      .valid={"plain"},
      .help="How directives are rendered: --add-binary SRC:DEST pairs, or plain SRC:DEST lines",
    }},

    // Lists of Values.
    {"libraries", arg::config{
      .l_name="--libraries", .s_name="-l",
      .def="",
      .defaults={
        "libsoftokn3.so", "libsoftokn3.chk",
        "libnss3.so", "libnssutil3.so",
        "libsmime3.so", "libssl3.so",
        "libnssckbi.so",
        "libnspr4.so", "libplc4.so", "libplds4.so",
        "libfreebl3.so", "libfreeblpriv3.so",
      },
      .list=true,
      .help="Libraries loaded at runtime by name, which ldd cannot see. Use none to disable",
    }},
    {"patterns", arg::config{
      .l_name="--patterns", .s_name="-p",
      .def="",
      .defaults={"libGLESv2.so*"},
      .list=true,
      .help="Optional libraries matched by filename pattern under the library roots. Use none to disable",
    }},
  };


  std::filesystem::path conf() {return std::filesystem::path(shared::config) / "sofpack" / "sofpack.conf";}


  // Parse a .conf file. They set defaults.
  void parse_conf(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) return;

    for (const auto& line : file::parse<vector>(path.string(), vectorize)) {
      const auto conf = trim<std::string_view>(line, " \t\r");
      if (conf.empty() || conf.starts_with('#')) continue;

      if (!conf.contains("=")) {
        std::cerr << "Invalid configuration: " << conf << std::endl;
        continue;
      }

      auto split = conf.find('=');
      auto k = trim<std::string_view>(conf.substr(0, split), " \t");
      auto v = trim<std::string_view>(conf.substr(split + 1), " \t");
      std::transform(k.begin(), k.end(), k.begin(), ::tolower);
      std::replace(k.begin(), k.end(), '-', '_');

      if (!switches.contains(k)) std::cerr << "Unrecognized configuration: " << conf << std::endl;
      else {
        try {emplace(k, v);}
        catch (const std::runtime_error&) {std::cerr << "Invalid option for " << k << ": " << v << std::endl;}
      }
    }
  }


  // Parse arguments
  void parse_args(const std::filesystem::path& path) {
    parse_conf(path);
    unknown.clear();

    // Digest the arguments.
    for (uint_fast8_t x = 0; x < args.size(); ++x) {
      bool match = false;
      for (auto& [key, value] : switches) {
        try {
          if (value.digest(args, x)) {
            match = true;
            break;
          }
        }
        catch (std::runtime_error& e) {
          std::stringstream out;
          if (std::string(e.what()) == "Help!") {
            out << "sofpack v" << VERSION << '\n' << "Stage the shared libraries a binary needs for packaging\n";

            auto compare = [](const Arg& a, const Arg& b){return a.position() < b.position();};
            std::multiset<Arg, decltype(compare)> ordered(compare);
            for (const auto& [key, value] : switches)
              ordered.emplace(value);
            for (const auto& value : ordered)
              out << value.get_help();
          }
          else if (std::string(e.what()) == "Version") out << VERSION << '\n';
          else throw;

          std::cout << out.str();
          exit(0);
        }
      }
      if (!match) unknown.emplace_back(args[x]);
    }

    if (!unknown.empty()) throw std::runtime_error("Unknown arguments: " + join(unknown, ' '));

    // Post update.
    for (const auto& [key, value] : switches) value.update();

    // Report the values.
    if (at("verbose") >= "debug") {
      std::cout << "Arguments: " << std::endl;
      for (const auto& [key, value] : switches) {
        std::cout << key << ": ";
        if (value.is_list()) std::cout << join(value.get_list(), ' ');
        else std::cout << value.get();
        std::cout << std::endl;
      }
    }
  }
}
