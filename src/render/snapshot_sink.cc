#include "snapshot_sink.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <glog/logging.h>

namespace IsingSim {

namespace {

template <typename Graph>
ImageBuffer RenderGraph(const Graph& graph) {
	ImageBuffer buffer;
	buffer.width = graph.Side();
	buffer.height = graph.Side();
	buffer.pixels.resize(graph.SiteCount());
	for (size_t site = 0; site < graph.SiteCount(); ++site) {
		// [-1, 1] -> [0, 255]
		const float s = std::clamp(static_cast<float>(graph.Get(site)), -1.0f, 1.0f);
		const uint32_t grey = static_cast<uint32_t>((s + 1.0f) * 127.5f);
		buffer.pixels[site] = 0xFF000000u | (grey << 16) | (grey << 8) | grey;
	}
	return buffer;
}

} // namespace

PgmSnapshotSink::PgmSnapshotSink(std::string output_dir)
	: output_dir_(std::move(output_dir)) {}

ImageBuffer PgmSnapshotSink::Render(const AnyGraph& graph) {
	return std::visit([](const auto& g) { return RenderGraph(*g); }, graph);
}

std::string PgmSnapshotSink::PathFor(const std::string& label) const {
	return (std::filesystem::path(output_dir_) / (label + ".pgm")).string();
}

bool PgmSnapshotSink::Persist(const ImageBuffer& buffer, const std::string& label) {
	if (buffer.width <= 0 || buffer.height <= 0 ||
			buffer.pixels.size() != static_cast<size_t>(buffer.width) * static_cast<size_t>(buffer.height)) {
		LOG(ERROR) << "Refusing to persist malformed snapshot '" << label << "'";
		return false;
	}

	std::error_code ec;
	std::filesystem::create_directories(output_dir_, ec);
	if (ec) {
		LOG(ERROR) << "Failed to create snapshot directory " << output_dir_ << ": " << ec.message();
		return false;
	}

	const std::string path = PathFor(label);
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) {
		LOG(ERROR) << "Failed to open snapshot file: " << path;
		return false;
	}
	out << "P5\n" << buffer.width << " " << buffer.height << "\n255\n";
	for (uint32_t pixel : buffer.pixels) {
		out.put(static_cast<char>(pixel & 0xFFu));
	}
	if (!out) {
		LOG(ERROR) << "Failed to write snapshot file: " << path;
		return false;
	}
	VLOG(1) << "Saved snapshot " << path;
	return true;
}

} // namespace IsingSim
