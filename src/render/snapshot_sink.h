#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../lattice/ising_graph.h"

namespace IsingSim {

// ARGB32 pixels, row-major
struct ImageBuffer {
	int width = 0;
	int height = 0;
	std::vector<uint32_t> pixels;
};

/**
 * Render/persistence collaborator consumed by the image task and the sweep
 */
class ISnapshotSink {
public:
	virtual ~ISnapshotSink() = default;

	virtual ImageBuffer Render(const AnyGraph& graph) = 0;
	virtual bool Persist(const ImageBuffer& buffer, const std::string& label) = 0;
};

/**
 * Maps site states to grey levels and writes binary PGM files under output_dir
 */
class PgmSnapshotSink : public ISnapshotSink {
public:
	explicit PgmSnapshotSink(std::string output_dir);

	ImageBuffer Render(const AnyGraph& graph) override;
	bool Persist(const ImageBuffer& buffer, const std::string& label) override;

	std::string PathFor(const std::string& label) const;

private:
	const std::string output_dir_;
};

} // namespace IsingSim
