#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "axml.hpp"
#include "axml_builder.hpp"

using namespace libaxml;
using namespace axml_test;

namespace fs = std::filesystem;

namespace {

class TempDir {
public:
  explicit TempDir(const std::string &name)
      : path_(fs::temp_directory_path() / name) {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

private:
  fs::path path_;
};

void writeBytes(const std::string &path, const Bytes &data) {
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

std::string readText(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

Bytes rootDocument() {
  DocumentBuilder builder;
  builder.startElement("", "root", {Attr::str("", "a", "b")})
      .endElement("", "root");
  return builder.build();
}

const std::string ROOT_XML =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<root a=\"b\"/>\n";

} // namespace

TEST_CASE("Streams are read to the end", "[facade]") {
  Bytes data(20000);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>(i * 7);
  }
  std::istringstream in(std::string(data.begin(), data.end()));
  CHECK(readAxmlStream(in) == data);
}

TEST_CASE("Buffers convert to strings and streams", "[facade]") {
  Bytes data = rootDocument();
  CHECK(convertAxmlToXmlString(data) == ROOT_XML);
  CHECK(convertAxmlToXmlString(data.data(), data.size()) == ROOT_XML);

  std::ostringstream out;
  convertAxmlToXmlStream(data.data(), data.size(), out);
  CHECK(out.str() == ROOT_XML);
}

TEST_CASE("Nothing is written to a stream when decoding fails", "[facade]") {
  Bytes data = rootDocument();
  data.resize(data.size() - 1);
  std::ostringstream out;
  CHECK_THROWS_AS(convertAxmlToXmlStream(data.data(), data.size(), out),
                  AxmlError);
  CHECK(out.str().empty());
}

TEST_CASE("Files convert to strings and files", "[facade]") {
  TempDir dir("libaxml_facade_files");
  std::string input = dir.file("AndroidManifest.xml");
  std::string output = dir.file("decoded.xml");
  writeBytes(input, rootDocument());

  CHECK(readAxmlFile(input) == rootDocument());
  CHECK(convertAxmlFileToXmlString(input) == ROOT_XML);

  convertAxmlFileToXmlFile(input, output);
  CHECK(readText(output) == ROOT_XML);
}

TEST_CASE("Missing input files are reported", "[facade]") {
  TempDir dir("libaxml_facade_missing");
  std::string missing = dir.file("missing.axml");

  CHECK_THROWS_AS(readAxmlFile(missing), std::runtime_error);
  CHECK_THROWS_WITH(convertAxmlFileToXmlString(missing),
                    Catch::Contains("Failed to open input file"));
}

TEST_CASE("Output files are not created when decoding fails", "[facade]") {
  TempDir dir("libaxml_facade_failure");
  std::string input = dir.file("broken.axml");
  std::string output = dir.file("broken.xml");
  Bytes data = rootDocument();
  data.resize(10);
  writeBytes(input, data);

  CHECK_THROWS_AS(convertAxmlFileToXmlFile(input, output), AxmlError);
  CHECK_FALSE(fs::exists(output));
}
