#include "writable_sink.hpp"

#include <array>

#include "internal/util/errors.hpp"

namespace favorites::exporter {

namespace {

constexpr std::size_t kCopyChunkBytes = 64 * 1024;

} // namespace

FileSink::FileSink(std::filesystem::path path) : path_(std::move(path)) {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw util::DeliveryError("cannot open for writing: " + path_.string());
  }
}

FileSink::~FileSink() {
  if (out_.is_open()) {
    out_.close();
  }
}

void FileSink::Write(std::string_view data) {
  if (!out_.is_open()) {
    throw util::DeliveryError("write after close: " + path_.string());
  }
  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out_) {
    throw util::DeliveryError("write failed: " + path_.string());
  }
}

void FileSink::Flush() {
  if (!out_.is_open()) {
    return;
  }
  out_.flush();
  if (!out_) {
    throw util::DeliveryError("flush failed: " + path_.string());
  }
}

void FileSink::Close() {
  if (!out_.is_open()) {
    return;
  }
  out_.close();
  if (out_.fail()) {
    throw util::DeliveryError("close failed: " + path_.string());
  }
}

void CopyFile(const std::filesystem::path& source, WritableSink& sink) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    throw util::DeliveryError("cannot open for reading: " + source.string());
  }

  std::array<char, kCopyChunkBytes> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0) {
      sink.Write(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
    }
  }
  if (in.bad()) {
    throw util::DeliveryError("read failed: " + source.string());
  }
  sink.Flush();
}

} // namespace favorites::exporter
