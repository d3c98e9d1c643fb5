#pragma once
#include <string>
#include <vector>

namespace tollgate {

// Named blobs under one root. Names are flat file names ("budget.json").
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // False when the blob is absent or unreadable.
    virtual bool get(const std::string& name, std::string& out) const = 0;
    // Replaces the blob atomically.
    virtual bool put(const std::string& name, const std::string& data, std::string& err) = 0;
    // Appends `line` plus '\n'.
    virtual bool append_line(const std::string& name, const std::string& line, std::string& err) = 0;
    // Succeeds when the blob is already absent.
    virtual bool del(const std::string& name, std::string& err) = 0;
    virtual bool exists(const std::string& name) const = 0;

    // Root directory, also used for lock files.
    virtual const std::string& root() const = 0;

    // Non-empty lines of the blob; empty when absent.
    std::vector<std::string> lines(const std::string& name) const;
};

// One file per blob, mode 0600. put() writes <name>.tmp, fsyncs, then renames.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::string root);

    // Creates the root directory.
    bool open(std::string& err);

    bool get(const std::string& name, std::string& out) const override;
    bool put(const std::string& name, const std::string& data, std::string& err) override;
    bool append_line(const std::string& name, const std::string& line, std::string& err) override;
    bool del(const std::string& name, std::string& err) override;
    bool exists(const std::string& name) const override;
    const std::string& root() const override { return root_; }

private:
    std::string root_;
    std::string path_of(const std::string& name) const;
};

}
