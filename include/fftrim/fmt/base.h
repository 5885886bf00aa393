//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_FMT_BASE_H_
#define FFTRIM_FMT_BASE_H_

//! @cond
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
//! @endcond

#include "fftrim/core/structure.h"
#include "fftrim/utils.h"

namespace fftrim {
class StructureReader;

template <class Reader = StructureReader>
class StructureStream {
public:
  StructureStream(Reader &reader): reader_(&reader) { }

  StructureStream(const StructureStream &) = delete;
  StructureStream &operator=(const StructureStream &) = delete;
  StructureStream(StructureStream &&) noexcept = default;
  StructureStream &operator=(StructureStream &&) noexcept = default;
  ~StructureStream() noexcept = default;

  /**
   * @brief Advance the stream to the next structure.
   *
   * @return true if the stream is not at the end, false otherwise.
   * @note If this function returns false, the current structure is not
   *       changed.
   */
  ABSL_MUST_USE_RESULT bool advance() {
    if (!reader_->getnext(block_)) {
      return false;
    }

    structure_ = reader_->parse(block_);
    return true;
  }

  /**
   * @brief Get the current structure.
   * @pre Previous call to advance() must return true, otherwise the behavior
   *      is unspecified.
   */
  TypedStructure &current() { return structure_; }

  /**
   * @brief Get the current structure.
   * @pre Previous call to advance() must return true, otherwise the behavior
   *      is unspecified.
   */
  const TypedStructure &current() const { return structure_; }

private:
  Reader *reader_;
  std::vector<std::string> block_;
  TypedStructure structure_;
};

template <class Stream>
Stream &operator>>(Stream &stream, TypedStructure &structure) {
  if (stream.advance()) {
    structure = std::move(stream.current());
  }
  return stream;
}

class StructureReader {
public:
  StructureReader() = default;
  StructureReader(const StructureReader &) = delete;
  StructureReader &operator=(const StructureReader &) = delete;
  StructureReader(StructureReader &&) noexcept = default;
  StructureReader &operator=(StructureReader &&) noexcept = default;
  virtual ~StructureReader() noexcept = default;

  /**
   * @brief Advance the reader to the next structure.
   * @return The next block containing the next structure. If the stream is at
   *         the end, an empty block is returned.
   */
  std::vector<std::string> next() {
    std::vector<std::string> block;
    if (!getnext(block)) {
      block.clear();
    }
    return block;
  }

  /**
   * @brief Advance the reader to the next structure.
   * @param block The block containing the next structure. If true is returned,
   *              pre-existing contents of the block are discarded. Otherwise,
   *              the block is in a valid but unspecified state.
   * @return true if the reader has successfully advanced to the next
   *         structure, false otherwise.
   * @note The name of this method is loosely based on the std::getline()
   *       function due to its similar semantics. The name also prevents
   *       name collision with the (non-virtual) next() method when subclasses
   *       override this method.
   */
  ABSL_MUST_USE_RESULT virtual bool
  getnext(std::vector<std::string> &block) = 0;

  /**
   * @brief Parse the current block and return the structure.
   * @param block The block to parse.
   * @return The current structure.
   * @note The returned structure will be empty if the block is empty or
   *       malformed.
   */
  virtual TypedStructure parse(const std::vector<std::string> &block) const = 0;

  /**
   * @brief Convert the reader to a stream object.
   */
  StructureStream<StructureReader> stream() { return { *this }; }
};

template <auto parser>
class DefaultReaderImpl: public StructureReader {
public:
  DefaultReaderImpl() = default;
  DefaultReaderImpl(std::istream &is): is_(&is) { }

  TypedStructure parse(const std::vector<std::string> &block) const final {
    return parser(block);
  }

protected:
  // NOLINTBEGIN(*-non-private-member-variables-in-classes)
  std::istream *is_;
  // NOLINTEND(*-non-private-member-variables-in-classes)
};

class StructureReaderFactory {
public:
  StructureReaderFactory() = default;
  StructureReaderFactory(const StructureReaderFactory &) = default;
  StructureReaderFactory &operator=(const StructureReaderFactory &) = default;
  StructureReaderFactory(StructureReaderFactory &&) noexcept = default;
  StructureReaderFactory &
  operator=(StructureReaderFactory &&) noexcept = default;
  virtual ~StructureReaderFactory() noexcept = default;

  /**
   * @brief Create a new reader from the given istream object.
   * @param is The input stream to read from.
   * @return A new reader instance.
   * @note The istream must survive until the returned reader is destructed.
   */
  virtual std::unique_ptr<StructureReader>
  from_stream(std::istream &is) const = 0;

  /**
   * @brief Find the factory for the given format name
   * @param name The name of the format to find the factory for.
   * @return A pointer to the factory instance for the given format name, or
   *         nullptr if no factory is registered for the given name.
   */
  static const StructureReaderFactory *find_factory(std::string_view name);

  /**
   * @brief Register the factory for the given format name(s).
   * @param factory The factory instance to register.
   * @param names The name(s) of the format to register the factory for.
   * @return Always true.
   *
   * @note This function is not thread-safe. Some synchronization mechanism
   *       must be used to call register_*() functions from multiple threads.
   */
  static bool register_factory(std::unique_ptr<StructureReaderFactory> factory,
                               const std::vector<std::string> &names);

  /**
   * @brief Register this factory for the given alias name.
   * @param alias An alias name to register the factory for.
   *
   * @note The instance of the factory must be existing until the end of the
   *       program. The easiest way to achieve this is using the returned
   *       factory instance from find_factory().
   */
  void register_for(std::string_view alias) const {
    register_for_name(this, alias);
  }

private:
  static void register_for_name(const StructureReaderFactory *factory,
                                std::string_view name);
};

template <class ReaderFactoryImpl>
bool register_reader_factory(const std::vector<std::string> &names) {
  return StructureReaderFactory::register_factory(
      std::make_unique<ReaderFactoryImpl>(), names);
}

template <class StructureReaderImpl>
class DefaultReaderFactoryImpl: public StructureReaderFactory {
public:
  std::unique_ptr<StructureReader> from_stream(std::istream &is) const final {
    return std::make_unique<StructureReaderImpl>(is);
  }
};

template <class SourceStream, class Reader = StructureReader>
class StructureReaderWrapper {
public:
  template <class... Args>
  StructureReaderWrapper(std::string_view fmt, Args &&...args)
      : is_(std::forward<Args>(args)...) {
    init(fmt);
  }

  std::vector<std::string> next() { return reader_->next(); }

  bool getnext(std::vector<std::string> &block) {
    return reader_->getnext(block);
  }

  TypedStructure parse(const std::vector<std::string> &block) const {
    return reader_->parse(block);
  }

  StructureStream<Reader> stream() { return { *reader_ }; }

  operator bool() const { return is_ && reader_; }

protected:
  void init(std::string_view fmt) {
    const StructureReaderFactory *factory =
        StructureReaderFactory::find_factory(fmt);

    if (ABSL_PREDICT_FALSE(factory == nullptr)) {
      ABSL_LOG(WARNING) << "No factory found for " << fmt;
      return;
    }

    reader_ = static_unique_ptr_cast<Reader>(factory->from_stream(is_));
  }

private:
  SourceStream is_;
  std::unique_ptr<Reader> reader_;
};

template <class Reader = StructureReader>
class FileStructureReader
    : public StructureReaderWrapper<std::ifstream, Reader> {
  using Base = StructureReaderWrapper<std::ifstream, Reader>;

public:
  /**
   * @brief Open the file, deducing the format from the file extension.
   */
  explicit FileStructureReader(const std::filesystem::path &path)
      : Base(extension_no_dot(path.extension()), path) { }

  FileStructureReader(std::string_view fmt, const std::filesystem::path &path)
      : Base(fmt, path) { }
};

template <class Reader = StructureReader>
using StringStructureReader =
    StructureReaderWrapper<std::istringstream, Reader>;
}  // namespace fftrim

#endif /* FFTRIM_FMT_BASE_H_ */
