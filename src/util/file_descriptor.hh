#pragma once

#include <memory>
#include <string>
#include <string_view>

class FileDescriptor
{
  struct FDWrapper
  {
    int fd_;
    bool eof_ = false;
    bool closed_ = false;
    bool non_blocking_ = false;
    unsigned int read_count_ = 0;
    unsigned int write_count_ = 0;

    explicit FDWrapper( const int fd );
    ~FDWrapper();

    void close();

    FDWrapper( const FDWrapper& other ) = delete;
    FDWrapper& operator=( const FDWrapper& other ) = delete;
    FDWrapper( FDWrapper&& other ) = delete;
    FDWrapper& operator=( FDWrapper&& other ) = delete;
  };

  std::shared_ptr<FDWrapper> internal_fd_;

  explicit FileDescriptor( std::shared_ptr<FDWrapper> other_shared_ptr );

protected:
  static constexpr size_t READ_BUFFER_SIZE = 65536;

  void set_eof() { internal_fd_->eof_ = true; }
  void register_read() { ++internal_fd_->read_count_; }
  void register_write() { ++internal_fd_->write_count_; }

public:
  explicit FileDescriptor( const int fd );

  /* append whatever is available (one read call) */
  void read( std::string& buffer );

  /* returns bytes written; a blocking descriptor writes everything */
  size_t write( std::string_view buffer );

  void close() { internal_fd_->close(); }

  /* shares the same underlying kernel descriptor */
  FileDescriptor duplicate() const;

  void set_blocking( const bool blocking );

  int fd_num() const { return internal_fd_->fd_; }
  bool eof() const { return internal_fd_->eof_; }
  bool closed() const { return internal_fd_->closed_; }
  bool non_blocking() const { return internal_fd_->non_blocking_; }
  unsigned int read_count() const { return internal_fd_->read_count_; }
  unsigned int write_count() const { return internal_fd_->write_count_; }

  FileDescriptor( const FileDescriptor& other ) = delete;
  FileDescriptor& operator=( const FileDescriptor& other ) = delete;
  FileDescriptor( FileDescriptor&& other ) = default;
  FileDescriptor& operator=( FileDescriptor&& other ) = default;
};

/* self-pipe used to interrupt a blocked poll() from another thread */
class WakeupPipe
{
  FileDescriptor read_end_, write_end_;

  WakeupPipe( std::pair<FileDescriptor, FileDescriptor> ends );

public:
  WakeupPipe();

  void notify();
  void drain();

  FileDescriptor& fd() { return read_end_; }
};
