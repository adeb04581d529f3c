/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <system_error>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace merklechain {

  /**
   * Reads the whole content of a binary file
   */
  inline outcome::result<common::Buffer> readFile(
      const std::filesystem::path &path) {
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (not file.good()) {
      return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    common::Buffer out;
    out.resize(file.tellg());
    file.seekg(0);
    file.read(reinterpret_cast<char *>(out.data()), out.size());
    if (not file.good()) {
      return std::make_error_code(std::errc::io_error);
    }
    return out;
  }

}  // namespace merklechain
