#pragma once

// PBO Archive Library
// A C++20 library for reading and writing the uncompressed PBO archive format:
// a directory tree bundled into one file with relative paths and modification
// times preserved.

#include "archive.hpp"
#include "operations.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Whole-tree operations: createArchive / extractArchive
//    - Pack a directory or unpack an archive in one call
//    - Progress and cancellation through pbo::Options
//
// 2. Low-level: Reader / Writer classes
//    - Reader::open() maps an archive and parses its header table
//    - Writer collects files and writes the archive in one pass
//
// 3. Archive class
//    - Unified interface for both reading and writing
//
// Example usage:
//
//   pbo::Error error;
//   pbo::Options options;
//   options.onProgress = [](const pbo::ProgressEvent &event) {
//     std::cout << event.message << "\n";
//   };
//
//   auto packed = pbo::createArchive("addons/my_mod", "my_mod.pbo", options, &error);
//   if (!packed) {
//     std::cerr << pbo::errorCodeName(error.code) << ": " << error.message << "\n";
//   }
//
//   auto archive = pbo::Archive::open("my_mod.pbo", &error);
//   if (archive) {
//     if (const auto *entry = archive->findFile("config.cpp")) {
//       archive->extract(*entry, "config.cpp");
//     }
//   }

namespace pbo {}
