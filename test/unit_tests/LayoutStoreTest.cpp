#include "LayoutStore.hpp"

#include "TestHeaders.hpp"

using namespace tg;

namespace {
string makeTempDirectory() {
  string pattern = GetTempDirectory() + string("tg_layout_XXXXXXXX");
  return string(mkdtemp(&pattern[0]));
}
}  // namespace

TEST_CASE("FileLayoutStore round trip", "[LayoutStore]") {
  string base = makeTempDirectory();
  FileLayoutStore store(base + "/nested/.termgate");

  REQUIRE(!store.get());

  json layout = json::parse(R"({"root":{"split":"h","children":[1,2]}})");
  store.set(layout);
  auto loaded = store.get();
  REQUIRE(loaded);
  REQUIRE(*loaded == layout);

  json replacement = json::parse(R"({"root":null})");
  store.set(replacement);
  REQUIRE(*store.get() == replacement);

  // No temporary files are left behind.
  int files = 0;
  for (const auto& entry :
       fs::directory_iterator(base + "/nested/.termgate")) {
    (void)entry;
    files++;
  }
  REQUIRE(files == 1);

  fs::remove_all(base);
}

TEST_CASE("FileLayoutStore reports a corrupt file", "[LayoutStore]") {
  string base = makeTempDirectory();
  FileLayoutStore store(base);
  {
    ofstream out(store.getPath());
    out << "{truncated";
  }
  REQUIRE_THROWS_AS(store.get(), runtime_error);
  fs::remove_all(base);
}

TEST_CASE("FileLayoutStore reports an unwritable directory", "[LayoutStore]") {
  string base = makeTempDirectory();
  {
    ofstream out(base + "/file");
    out << "x";
  }
  // A regular file where the directory should be.
  FileLayoutStore store(base + "/file/sub");
  REQUIRE_THROWS_AS(store.set(json::object()), runtime_error);
  fs::remove_all(base);
}
