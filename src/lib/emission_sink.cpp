#include <rbgen/emission_sink.hpp>
#include <rbgen/naming.hpp>

#include <fstream>
#include <functional>
#include <system_error>

namespace rbgen {

  namespace fs = std::filesystem;

  namespace {

    class file_source : public source_file {
      fs::path path_;
      std::ofstream out_;

    public:
      explicit file_source(fs::path path)
          : path_(std::move(path)), out_(path_, std::ios::binary) {
        if (!out_) throw emission_error("cannot open " + path_.string());
      }

      void
      write(std::string_view text) override {
        out_.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out_) throw emission_error("cannot write " + path_.string());
      }

      void
      close() override {
        out_.close();
        if (!out_) throw emission_error("cannot close " + path_.string());
      }
    };

    // Buffers text and hands it to the sink on close(). A file destroyed
    // before close() leaves nothing behind.
    class memory_source : public source_file {
      std::string text_;
      std::function<void(std::string)> commit_;

    public:
      explicit memory_source(std::function<void(std::string)> commit)
          : commit_(std::move(commit)) {}

      void
      write(std::string_view text) override {
        text_.append(text);
      }

      void
      close() override {
        if (commit_) commit_(std::move(text_));
        commit_ = nullptr;
      }
    };

    void
    check_name(const std::string& fully_qualified_name) {
      if (!is_qualified_identifier(fully_qualified_name))
        throw emission_error("invalid source file name '" +
                             fully_qualified_name + "'");
    }

  } // namespace

  std::unique_ptr<source_file>
  directory_sink::create_source_file(const std::string& fully_qualified_name) {
    check_name(fully_qualified_name);
    if (created_.count(fully_qualified_name))
      throw emission_error("attempt to recreate file " + fully_qualified_name);

    auto path = root_ / source_path_for(fully_qualified_name);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw emission_error(ec.message());

    auto file = std::make_unique<file_source>(path);
    created_.insert(fully_qualified_name);
    return file;
  }

  std::unique_ptr<source_file>
  memory_sink::create_source_file(const std::string& fully_qualified_name) {
    if (auto it = failures_.find(fully_qualified_name); it != failures_.end())
      throw emission_error(it->second);

    check_name(fully_qualified_name);
    if (created_.count(fully_qualified_name))
      throw emission_error("attempt to recreate file " + fully_qualified_name);
    created_.insert(fully_qualified_name);

    return std::make_unique<memory_source>(
        [this, fully_qualified_name](std::string text) {
          files_.insert_or_assign(fully_qualified_name, std::move(text));
        });
  }

  void
  memory_sink::fail_on(std::string fully_qualified_name, std::string detail) {
    failures_.insert_or_assign(std::move(fully_qualified_name),
                               std::move(detail));
  }

  const std::string*
  memory_sink::find(const std::string& fully_qualified_name) const {
    auto it = files_.find(fully_qualified_name);
    if (it == files_.end()) return nullptr;
    return &it->second;
  }

} // namespace rbgen
