// core/installation.hpp - Minecraft installation layout
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace uuidfix {

struct SaveEntry {
  std::string name;
  fs::path path;
};

// A directory literally named "saves". A missing directory is an empty
// collection, not an error.
class SaveCollection {
public:
  explicit SaveCollection(const fs::path &path);

  const fs::path &path() const { return path_; }
  bool exists() const;
  std::vector<SaveEntry> saves() const;

private:
  fs::path path_;
};

struct VersionEntry {
  std::string name;
  fs::path path;

  SaveCollection saves() const;
};

class Installation {
public:
  explicit Installation(const fs::path &root);

  const fs::path &root() const { return root_; }
  std::vector<VersionEntry> versions() const;
  SaveCollection non_isolated_saves() const;

private:
  fs::path root_;
};

enum class CollectionKind { NonIsolated, Isolated };

struct CollectionChoice {
  CollectionKind kind;
  std::string version_name; // empty for NonIsolated
  SaveCollection saves;

  std::string label() const;
};

// Every save collection worth offering: one per version folder that has its
// own saves directory, then the shared one if it exists. Installations can
// carry both at once.
std::vector<CollectionChoice> enumerate_collections(const Installation &mc);

// Empty version_name selects the shared collection.
CollectionChoice find_collection(const Installation &mc,
                                 const std::string &version_name);

} // namespace uuidfix
