#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <cstdlib>

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace argon::utils::env {
  namespace {
    using types::Err;
    using types::i32;
    using types::PCStr;
    using types::Result;
    using types::String;
    using types::UniquePointer;
    using types::usize;

    using error::ArgonError;
    using enum error::ArgonErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing a copy of the variable's value.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char* rawPtr     = nullptr;
    usize bufferSize = 0;

    const i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      return Err(ArgonError(IoError, "Failed to retrieve environment variable"));

    if (!ptrManager)
      return Err(ArgonError(NotFound, "Environment variable not found"));

    return String(ptrManager.get());
#else
    const PCStr value = std::getenv(name);

    if (!value)
      return Err(ArgonError(NotFound, "Environment variable not found"));

    return String(value);
#endif
  }
} // namespace argon::utils::env
