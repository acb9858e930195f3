#include "spdrdr/options.hh"
#include "spdrdr/words.hh"
#include "spdrdr/pacer.hh"
#include "spdrdr/tui.hh"
#include "spdrdr/log.hh"

#include "ob/tty.hh"
#include "ob/string.hh"

#include <fcntl.h>
#include <unistd.h>
#include <cxxabi.h>

#include <cerrno>
#include <cstdlib>
#include <cstddef>

#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <typeinfo>

#include <filesystem>
namespace fs = std::filesystem;

// values taken from the command line
struct Settings
{
  int wpm {500};
  std::size_t chunk {40};
  std::size_t skip {0};
};

// prototypes
int program_options(Options& pg, Settings& cfg);
std::string type_name(std::exception const& e);
std::vector<std::string> load_words(Options const& pg, std::string& name);

int program_options(Options& pg, Settings& cfg)
{
  pg.name("spdrdr").version("0.1.0 (19.10.2026)");
  pg.description("A speedreader for the terminal.");

  pg.usage("[--wpm|-w <int>] [--chunk|-c <int>] [--skip|-s <int>] [--debug|-d] [--config|-u <file>] [<file>]");
  pg.usage("[--help|-h]");
  pg.usage("[--version|-v]");

  pg.info("Key Bindings", {
    "q|Q\n    quit the program",
    "<ctrl-c>\n    quit the program and print the position to resume from",
    "<space>|p\n    toggle play/pause",
    "k|+|<up>\n    increase wpm by 50",
    "j|-|<down>\n    decrease wpm by 50, below zero reads backwards",
    "l|<right>\n    goto next word while paused",
    "h|<left>\n    goto previous word while paused",
    "g|<home>\n    goto beginning while paused",
    "G|<end>\n    goto end while paused",
  });

  pg.info("Configuration", {
    R"RAW(Config File: '${HOME}/.spdrdr/config'

  Use '--config=<file>' to override the default config file,
  or the special name 'NONE' to skip it.
  Each line holds one command, lines that begin with '#' are comments.
  Values given on the command line take precedence.

  wpm <-1000-1000>
  chunk <1-1000>
  style <word|focus|punct|context|current|status|border> <#000000-#ffffff|0-255|Colour|reverse|clear>)RAW"
  });

  pg.info("Examples", {
    "spdrdr <file>",
    "cat <file> | spdrdr",
    "spdrdr --wpm 300 --skip 1200 <file>",
    "spdrdr --help",
  });

  pg.info("Exit Codes", {"0 -> normal", "1 -> error"});

  // general flags
  pg.set("help,h", "Print the help output.");
  pg.set("version,v", "Print the program version.");
  pg.set("debug,d", "Print a debug log and full error details on exit.");

  // options
  pg.set("wpm,w", "500", "int", "Start reading at 'int' words per minute, in the range <-1000-1000>.\n    Negative values read backwards and zero freezes the current word.");
  pg.set("chunk,c", "40", "int", "Show 'int' words of context around the current word, in the range <1-1000>.");
  pg.set("skip,s", "0", "int", "Skip the first 'int' words before starting.");
  pg.set("config,u", "", "file", "Use the commands in the config file 'file' for initialization.\n    To skip the config file, use the special name 'NONE'.");

  pg.set_pos();

  int status {pg.parse()};

  if (status == 0)
  {
    try
    {
      cfg.wpm = pg.get<int>("wpm");
      auto const chunk = pg.get<long long>("chunk");
      auto const skip = pg.get<long long>("skip");

      if (cfg.wpm < Pacing_Engine::wpm_min || cfg.wpm > Pacing_Engine::wpm_max)
      {
        throw std::invalid_argument("'--wpm' is out of range <-1000-1000>");
      }

      if (chunk < static_cast<long long>(Tui::chunk_min) ||
        chunk > static_cast<long long>(Tui::chunk_max))
      {
        throw std::invalid_argument("'--chunk' is out of range <1-1000>");
      }

      if (skip < 0)
      {
        throw std::invalid_argument("'--skip' must not be negative");
      }

      cfg.chunk = static_cast<std::size_t>(chunk);
      cfg.skip = static_cast<std::size_t>(skip);
    }
    catch (std::invalid_argument const& e)
    {
      std::cerr << "Usage:\n" << pg.usage() << "\n";
      std::cerr << "Error: " << e.what() << "\n";

      return -1;
    }
  }

  if (status < 0)
  {
    std::cerr << "Usage:\n" << pg.usage() << "\n";
    std::cerr << "Error: " << pg.error() << "\n";

    auto const similar_names = pg.similar();
    if (similar_names.size() > 0)
    {
      std::cerr
      << "did you mean:\n";
      for (auto const& e : similar_names)
      {
        std::cerr
        << "  --" << e << "\n";
      }
    }

    return -1;
  }

  if (pg.get<bool>("help"))
  {
    std::cout << pg.help();

    return 1;
  }

  if (pg.get<bool>("version"))
  {
    std::cout << pg.name() << " v" << pg.version() << "\n";

    return 1;
  }

  return 0;
}

std::string type_name(std::exception const& e)
{
  int status {0};
  std::unique_ptr<char, decltype(&std::free)> name {
    abi::__cxa_demangle(typeid(e).name(), nullptr, nullptr, &status), std::free};

  if (status != 0 || ! name)
  {
    return typeid(e).name();
  }

  return name.get();
}

std::vector<std::string> load_words(Options const& pg, std::string& name)
{
  auto const file = pg.get_pos_vec();

  if (! OB::Tty::is_term(STDIN_FILENO) || (! file.empty() && file.at(0) == "-"))
  {
    // read from stdin
    auto words = parse_words(std::cin);
    name = "*stdin*";

    // reset stdin
    int tty = open("/dev/tty", O_RDONLY);
    if (tty == -1)
    {
      throw std::system_error(errno, std::generic_category(), "could not open '/dev/tty'");
    }
    if (dup2(tty, STDIN_FILENO) == -1)
    {
      int const err {errno};
      close(tty);
      throw std::system_error(err, std::generic_category(), "could not reopen stdin");
    }
    close(tty);
    std::cin.clear();

    return words;
  }

  if (file.empty())
  {
    throw std::runtime_error("no input, pass a file or pipe text to stdin");
  }

  // read from file
  fs::path const path {file.at(0)};

  if (! fs::exists(path))
  {
    throw std::runtime_error("the file does not exist '" + path.string() + "'");
  }

  std::ifstream ifile {path};
  if (! ifile.is_open())
  {
    throw std::runtime_error("could not open the file '" + path.string() + "'");
  }

  name = path.lexically_normal().string();

  return parse_words(ifile);
}

int main(int argc, char *argv[])
{
  Options pg {argc, argv};
  Settings cfg;
  int pstatus {program_options(pg, cfg)};
  if (pstatus > 0) return 0;
  if (pstatus < 0) return 1;

  std::ios_base::sync_with_stdio(false);

  Debug_Log log {pg.get<bool>("debug")};

  std::string name;
  std::unique_ptr<Word_Window> window;
  std::unique_ptr<Tui> tui;

  // configuration errors, nothing has been shown yet
  try
  {
    if (! OB::Tty::is_term(STDOUT_FILENO))
    {
      throw std::runtime_error("stdout is not a tty");
    }

    window = std::make_unique<Word_Window>(load_words(pg, name));
    window->seek(cfg.skip);

    log("loaded ", window->size(), " words from '", name, "'");

    tui = std::make_unique<Tui>(*window, log);
    tui->file(name);

    // default to '~/.spdrdr/config'
    fs::path const config {pg.find("config") ? pg.get<std::string>("config") :
      OB::Tty::env_var("HOME") + "/." + pg.name() + "/config"};

    tui->load_config(config);

    if (pg.find("wpm"))
    {
      tui->wpm(cfg.wpm);
    }

    if (pg.find("chunk"))
    {
      tui->chunk(cfg.chunk);
    }
  }
  catch (std::exception const& e)
  {
    std::cerr << "Error: " << e.what() << "\n";

    return 1;
  }
  catch (...)
  {
    std::cerr << "Error: an unexpected error occurred\n";

    return 1;
  }

  try
  {
    // start event loop
    auto const exit = tui->run();

    if (exit.reason == Tui::Exit::Reason::interrupt)
    {
      std::cout
      << "stopped at word " << exit.index << "\n"
      << "resume with: " << pg.name() << " --skip " << exit.index;

      if (name != "*stdin*")
      {
        std::cout << " " << OB::String::shell_quote(name);
      }

      std::cout << "\n" << std::flush;
    }
  }
  catch (std::exception const& e)
  {
    std::cerr << "Error: " << type_name(e) << ": " << e.what() << "\n";

    if (log.enabled())
    {
      std::cerr << log.str();
    }

    return 1;
  }
  catch (...)
  {
    std::cerr << "Error: an unexpected error occurred\n";

    if (log.enabled())
    {
      std::cerr << log.str();
    }

    return 1;
  }

  if (log.enabled())
  {
    std::cerr << log.str();
  }

  return 0;
}
