#include <catch2/catch.hpp>

#include "axml.hpp"
#include "axml_builder.hpp"

using namespace libaxml;
using namespace axml_test;

namespace {

const std::string ANDROID = ANDROID_NAMESPACE_URI;

const char *const SAMPLE_MANIFEST =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<manifest xmlns:android=\"http://schemas.android.com/apk/res/android\" "
    "package=\"com.example.app\" android:versionCode=\"7\" "
    "android:versionName=\"1.2\">"
    "<uses-sdk android:minSdkVersion=\"21\" android:targetSdkVersion=\"33\"/>"
    "<uses-permission android:name=\"android.permission.INTERNET\"/>"
    "<uses-permission-sdk-23 android:name=\"android.permission.CAMERA\"/>"
    "<permission android:name=\"com.example.app.PRIVATE\"/>"
    "<application android:name=\".App\" android:label=\"@0x7f0b0001\" "
    "android:icon=\"@0x7f080000\">"
    "<activity android:name=\".MainActivity\">"
    "<intent-filter>"
    "<action android:name=\"android.intent.action.MAIN\"/>"
    "<category android:name=\"android.intent.category.LAUNCHER\"/>"
    "</intent-filter>"
    "</activity>"
    "<activity-alias android:name=\".Alias\"/>"
    "<service android:name=\".SyncService\"/>"
    "<receiver android:name=\".BootReceiver\">"
    "<intent-filter>"
    "<action android:name=\"android.intent.action.BOOT_COMPLETED\"/>"
    "</intent-filter>"
    "</receiver>"
    "<provider android:name=\".Files\"/>"
    "</application>"
    "</manifest>\n";

} // namespace

TEST_CASE("Manifest summary collects the main fields", "[manifest]") {
  ManifestSummary summary = summarizeManifest(SAMPLE_MANIFEST);

  CHECK(summary.package == "com.example.app");
  CHECK(summary.version_code == "7");
  CHECK(summary.version_name == "1.2");
  CHECK(summary.min_sdk == "21");
  CHECK(summary.target_sdk == "33");
  CHECK(summary.application_name == ".App");
  CHECK(summary.application_label == "@0x7f0b0001");
  CHECK(summary.application_icon == "@0x7f080000");

  std::vector<std::string> permissions = {"android.permission.INTERNET",
                                          "android.permission.CAMERA",
                                          "com.example.app.PRIVATE"};
  CHECK(summary.permissions == permissions);

  REQUIRE(summary.activities.size() == 2);
  CHECK(summary.activities[0].name == ".MainActivity");
  REQUIRE(summary.activities[0].intent_filters.size() == 1);
  const IntentFilter &launcher = summary.activities[0].intent_filters[0];
  REQUIRE(launcher.actions.size() == 1);
  CHECK(launcher.actions[0] == "android.intent.action.MAIN");
  REQUIRE(launcher.categories.size() == 1);
  CHECK(launcher.categories[0] == "android.intent.category.LAUNCHER");
  CHECK(summary.activities[1].name == ".Alias");

  REQUIRE(summary.services.size() == 1);
  CHECK(summary.services[0].name == ".SyncService");
  REQUIRE(summary.receivers.size() == 1);
  CHECK(summary.receivers[0].intent_filters.size() == 1);
  std::vector<std::string> providers = {".Files"};
  CHECK(summary.providers == providers);
}

TEST_CASE("Manifest summary follows the declared android prefix",
          "[manifest]") {
  ManifestSummary summary = summarizeManifest(
      "<manifest xmlns:a=\"http://schemas.android.com/apk/res/android\" "
      "package=\"p\" a:versionCode=\"3\"><uses-sdk minSdkVersion=\"9\"/>"
      "</manifest>");

  CHECK(summary.version_code == "3");
  CHECK(summary.min_sdk == "9");
  CHECK(summary.target_sdk.empty());
  CHECK(summary.activities.empty());
}

TEST_CASE("Manifest summary report", "[manifest]") {
  std::string report = formatManifestSummary(summarizeManifest(SAMPLE_MANIFEST));

  CHECK_THAT(report, Catch::StartsWith("Package: com.example.app\n"));
  CHECK_THAT(report, Catch::Contains("Min SDK: 21\n"));
  CHECK_THAT(report, Catch::Contains("Permissions (3):\n"
                                     "  android.permission.INTERNET\n"));
  CHECK_THAT(report, Catch::Contains("Activities (2):\n"
                                     "  .MainActivity\n"
                                     "    action: android.intent.action.MAIN\n"
                                     "    category: "
                                     "android.intent.category.LAUNCHER\n"));
  CHECK_THAT(report, Catch::EndsWith("Providers (1):\n  .Files\n"));
}

TEST_CASE("Decoded binary manifests can be summarized", "[manifest]") {
  DocumentBuilder builder;
  builder.resourceString("versionCode", 0x0101021b);
  builder.resourceString("minSdkVersion", 0x0101020c);
  builder.startNamespace("android", ANDROID)
      .startElement("", "manifest",
                    {Attr::str("", "package", "com.example"),
                     Attr::typed(ANDROID, "versionCode", ValueType::INT_DEC,
                                 42)})
      .startElement("", "uses-sdk",
                    {Attr::typed(ANDROID, "minSdkVersion", ValueType::INT_DEC,
                                 24)})
      .endElement("", "uses-sdk")
      .endElement("", "manifest")
      .endNamespace("android", ANDROID);

  std::string xml = convertAxmlToXmlString(builder.build());
  ManifestSummary summary = summarizeManifest(xml);
  CHECK(summary.package == "com.example");
  CHECK(summary.version_code == "42");
  CHECK(summary.min_sdk == "24");
  CHECK_THAT(formatManifestSummary(summary),
             Catch::Contains("Package: com.example\n"));

  std::string pretty = prettyPrintXml(xml);
  CHECK_THAT(pretty, Catch::StartsWith("<?xml"));
  CHECK_THAT(pretty, Catch::Contains("\n  <uses-sdk android:minSdkVersion=\"24\""));
}

TEST_CASE("Pretty printing keeps the document content", "[manifest]") {
  std::string pretty = prettyPrintXml("<a><b>text</b><c/></a>", "\t");
  CHECK(pretty == "<a>\n\t<b>text</b>\n\t<c />\n</a>\n");
}

TEST_CASE("Post-processing rejects unusable XML", "[manifest]") {
  CHECK_THROWS_WITH(prettyPrintXml("<a><b></a>"),
                    Catch::StartsWith("Failed to parse XML string: "));
  CHECK_THROWS_WITH(summarizeManifest("<root/>"),
                    "XML has no <manifest> root element");
}
