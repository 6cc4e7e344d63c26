#pragma once
#include "core/composite_source.hpp"
#include "readers/IArchiveReader.hpp"

namespace panes {

// Turns an opened container into the source the viewer pages through.
//
// - nested containers present: images between them become parent
//   segments, each nested container becomes its own segment at the
//   position its name holds in the natural order;
// - otherwise, images spread over several directories: one segment per
//   directory, directories in natural order;
// - otherwise the plain ArchiveImageSource is returned.
//
// Nested containers are extracted to private temp files owned by their
// segment. Below opts.limits.maxDepth they are flattened again; at the
// bound they open as plain sources. A nested container that fails to open
// is logged and skipped.
std::unique_ptr<ImageSource> buildImageSource(std::shared_ptr<IArchiveReader> reader,
                                              const OpenOptions& opts);

// Image indices grouped by containing directory ("/" for the root),
// directories in natural order. Image order inside a group is preserved.
std::vector<std::pair<std::string, std::vector<size_t>>> groupImagesByDirectory(const IArchiveReader& reader);

} // namespace panes
