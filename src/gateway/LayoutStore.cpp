#include "LayoutStore.hpp"

namespace tg {
optional<json> FileLayoutStore::get() {
  string path = getPath();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return nullopt;
  }
  ifstream in(path);
  if (!in.is_open()) {
    throw runtime_error("Could not open " + path + ": " + strerror(errno));
  }
  stringstream contents;
  contents << in.rdbuf();
  try {
    return json::parse(contents.str());
  } catch (const json::parse_error& e) {
    throw runtime_error("Corrupt layout in " + path + ": " + e.what());
  }
}

void FileLayoutStore::set(const json& layout) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw runtime_error("Could not create " + directory + ": " +
                        ec.message());
  }
  string path = getPath();
  string tmpPath = path + ".tmp." + to_string(::getpid());
  {
    ofstream out(tmpPath, ios::out | ios::trunc);
    if (!out.is_open()) {
      throw runtime_error("Could not open " + tmpPath + ": " +
                          strerror(errno));
    }
    out << dumpJson(layout);
    out.flush();
    if (!out.good()) {
      out.close();
      ::unlink(tmpPath.c_str());
      throw runtime_error("Could not write " + tmpPath);
    }
  }
  if (::rename(tmpPath.c_str(), path.c_str()) == -1) {
    int renameErrno = errno;
    ::unlink(tmpPath.c_str());
    throw runtime_error("Could not replace " + path + ": " +
                        strerror(renameErrno));
  }
  VLOG(1) << "Saved layout to " << path;
}
}  // namespace tg
