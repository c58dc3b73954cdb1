#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "axml.hpp"

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

struct CliOptions {
  bool pretty_print = false;
  bool summary = false;
  bool quiet = false;
  bool no_declaration = false;
  std::string dir;
};

void print_usage() {
  std::cerr
      << "usage: axml2xml [-p] [-s] [-q] [-n] input [output]\n"
      << "       axml2xml [-p] [-s] [-q] [-n] -d DIR\n\n"
      << "Decodes Android binary XML (e.g. AndroidManifest.xml from an APK) "
         "into readable XML.\n\n"
      << "Options:\n"
      << "  -p, --pretty-print    Format the XML with proper indentation\n"
      << "  -s, --summary         Print a manifest summary instead of XML\n"
      << "  -q, --quiet           Do not print decode warnings\n"
      << "  -n, --no-declaration  Omit the <?xml ...?> declaration\n"
      << "  -d, --dir DIR         Decode every file in DIR to stdout\n"
      << "  -h, --help            Show this help message\n\n"
      << "Input can be '-' to use stdin, and output can be '-' to use "
         "stdout.\n";
}

bool apply_short_flag(char flag, CliOptions &options) {
  switch (flag) {
  case 'p':
    options.pretty_print = true;
    return true;
  case 's':
    options.summary = true;
    return true;
  case 'q':
    options.quiet = true;
    return true;
  case 'n':
    options.no_declaration = true;
    return true;
  default:
    return false;
  }
}

libaxml::DecodeOptions decode_options(const CliOptions &options,
                                      const std::string &source) {
  libaxml::DecodeOptions opts;
  opts.xml_declaration = !options.no_declaration;
  if (!options.quiet) {
    opts.warning_callback = [source](const std::string &category,
                                     const std::string &message) {
      std::cerr << source << ": [" << category << "] " << message << "\n";
    };
  }
  return opts;
}

std::string render(const std::vector<uint8_t> &data, const CliOptions &options,
                   const std::string &source) {
  std::string xml =
      libaxml::convertAxmlToXmlString(data, decode_options(options, source));
  if (options.summary) {
    return libaxml::formatManifestSummary(libaxml::summarizeManifest(xml));
  }
  if (options.pretty_print) {
    return libaxml::prettyPrintXml(xml);
  }
  return xml;
}

int decode_directory(const CliOptions &options) {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::directory_iterator it(options.dir, ec);
  if (ec) {
    std::cerr << "Error: Cannot read directory " << options.dir << ": "
              << ec.message() << "\n";
    return 1;
  }

  int status = 0;
  for (const fs::directory_entry &entry : it) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::string path = entry.path().string();
    try {
      std::string output = render(libaxml::readAxmlFile(path), options, path);
      std::cout << "==> " << path << " <==\n" << output << "\n";
    } catch (const std::exception &e) {
      std::cerr << "Error: " << path << ": " << e.what() << "\n";
      status = 1;
    }
  }
  return status;
}

int main(int argc, char *argv[]) {
  CliOptions options;
  std::string input_path;
  std::string output_path;

  int arg_idx = 1;
  while (arg_idx < argc) {
    const char *arg = argv[arg_idx];

    if (arg[0] == '-' && arg[1] != '-' && arg[1] != '\0' && arg[2] != '\0') {
      CliOptions combined = options;
      bool valid_combo = true;
      for (int i = 1; arg[i] != '\0'; i++) {
        if (arg[i] == 'h') {
          print_usage();
          return 0;
        }
        if (!apply_short_flag(arg[i], combined)) {
          valid_combo = false;
          break;
        }
      }
      if (valid_combo) {
        options = combined;
        arg_idx++;
        continue;
      }
    }

    if (strcmp(arg, "-p") == 0 || strcmp(arg, "--pretty-print") == 0) {
      options.pretty_print = true;
      arg_idx++;
    } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--summary") == 0) {
      options.summary = true;
      arg_idx++;
    } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
      options.quiet = true;
      arg_idx++;
    } else if (strcmp(arg, "-n") == 0 ||
               strcmp(arg, "--no-declaration") == 0) {
      options.no_declaration = true;
      arg_idx++;
    } else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--dir") == 0) {
      if (arg_idx + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a directory\n\n";
        print_usage();
        return 1;
      }
      options.dir = argv[arg_idx + 1];
      arg_idx += 2;
    } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
      print_usage();
      return 0;
    } else {
      break;
    }
  }

  if (!options.dir.empty()) {
    if (arg_idx < argc) {
      std::cerr << "Error: Cannot specify input files with -d/--dir\n";
      return 1;
    }
    try {
      return decode_directory(options);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  if (arg_idx >= argc) {
    if (!isatty(fileno(stdin))) {
      input_path = "-";
      output_path = "-";
    } else {
      std::cerr << "Error: Missing input file\n\n";
      print_usage();
      return 1;
    }
  } else {
    input_path = argv[arg_idx++];
    output_path = arg_idx < argc ? argv[arg_idx++] : "-";
  }

  try {
    std::vector<uint8_t> data;
    if (input_path == "-") {
#ifdef _WIN32
      _setmode(_fileno(stdin), _O_BINARY);
#endif
      data = libaxml::readAxmlStream(std::cin);
    } else {
      data = libaxml::readAxmlFile(input_path);
    }

    std::string output =
        render(data, options, input_path == "-" ? "<stdin>" : input_path);

    if (output_path == "-") {
      std::cout << output;
    } else {
      std::ofstream output_file(output_path, std::ios::binary);
      if (!output_file) {
        std::cerr << "Error: Cannot open output file: " << output_path << "\n";
        return 1;
      }
      output_file << output;
    }

    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
