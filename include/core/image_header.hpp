#pragma once
#include "core/types.hpp"

namespace panes {

// Measures encoded images. Never renders.
class BitmapDecoder {
public:
  virtual ~BitmapDecoder() = default;
  virtual bool measure(const Bytes& data, PixelSize& out) const = 0;
};

// Reads dimensions straight from the container headers of
// PNG, JPEG, GIF, WebP, BMP and JPEG 2000 data.
class HeaderBitmapDecoder : public BitmapDecoder {
public:
  bool measure(const Bytes& data, PixelSize& out) const override;
};

std::shared_ptr<const BitmapDecoder> defaultDecoder();

// Measures `bytes` and packages them; false if the decoder rejects them.
bool makeBitmap(const BitmapDecoder& dec, Bytes bytes, const std::string& format, Bitmap& out);

} // namespace panes
