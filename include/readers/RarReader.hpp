#pragma once
#include "readers/ArchiveReaderBase.hpp"

namespace panes {

// RAR / CBR (RAR4 and RAR5) through libunrar. Extraction is lazy: each
// read reopens the archive and walks headers to the wanted entry. The
// password travels through the unrar callback, which also collects the
// extracted bytes.
class RarReader : public ArchiveReaderBase {
public:
  RarReader() = default;
  ~RarReader() override { close(); }

  ArchiveFamily family() const override { return ArchiveFamily::Rar; }
  bool open(const std::filesystem::path& path, const OpenOptions& opts,
            OpenError& code, std::string& err) override;
  void close() override {}

protected:
  bool readEntry(const Entry& e, Bytes& out, std::string& err) override;

private:
  // ERAR_* of the last failed unrar call (0 when none).
  int lastError_ = 0;
  std::optional<std::string> password_;
};

} // namespace panes
