#pragma once

// std
#include <stdexcept>
#include <string>

namespace lse {

  // Bad construction dimensions or scale.
  class InvalidSpriteSize : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  class TextureIndexOutOfRange : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
  };

  // Assigned value is not a usable texture.
  class TextureTypeMismatch : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  class SpriteNotFound : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class EmptySpriteList : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
  };

  // File could not be opened or read.
  class TextureLoadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // File was read but the image (or the requested region of it) is unusable.
  class TextureDecodeError : public TextureLoadError {
  public:
    using TextureLoadError::TextureLoadError;
  };

  class RenderError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace lse
