#include "file_descriptor.hh"
#include "exception.hh"

#include <fcntl.h>
#include <iostream>
#include <unistd.h>

using namespace std;

FileDescriptor::FDWrapper::FDWrapper( const int fd )
  : fd_( fd )
{
  if ( fd < 0 ) {
    throw runtime_error( "invalid fd number:" + to_string( fd ) );
  }

  const int flags = CheckSystemCall( "fcntl", fcntl( fd, F_GETFL ) );
  non_blocking_ = flags & O_NONBLOCK;
}

void FileDescriptor::FDWrapper::close()
{
  CheckSystemCall( "close", ::close( fd_ ) );
  eof_ = closed_ = true;
}

FileDescriptor::FDWrapper::~FDWrapper()
{
  try {
    if ( closed_ ) {
      return;
    }
    close();
  } catch ( const exception& e ) {
    cerr << "Exception destructing FDWrapper: " << e.what() << "\n";
  }
}

FileDescriptor::FileDescriptor( const int fd )
  : internal_fd_( make_shared<FDWrapper>( fd ) )
{}

FileDescriptor::FileDescriptor( shared_ptr<FDWrapper> other_shared_ptr )
  : internal_fd_( move( other_shared_ptr ) )
{}

FileDescriptor FileDescriptor::duplicate() const
{
  return FileDescriptor { internal_fd_ };
}

void FileDescriptor::read( string& buffer )
{
  const size_t original_size = buffer.size();
  buffer.resize( original_size + READ_BUFFER_SIZE );

  const ssize_t bytes_read = ::read( fd_num(), buffer.data() + original_size, READ_BUFFER_SIZE );
  if ( bytes_read < 0 ) {
    buffer.resize( original_size );
    if ( internal_fd_->non_blocking_ and ( errno == EAGAIN or errno == EINPROGRESS ) ) {
      return;
    }
    throw unix_error { "read" };
  }

  register_read();

  if ( bytes_read == 0 ) {
    internal_fd_->eof_ = true;
  }

  buffer.resize( original_size + bytes_read );
}

size_t FileDescriptor::write( string_view buffer )
{
  size_t total_written = 0;

  while ( not buffer.empty() ) {
    const ssize_t bytes_written = ::write( fd_num(), buffer.data(), buffer.size() );
    if ( bytes_written < 0 ) {
      if ( internal_fd_->non_blocking_ and ( errno == EAGAIN or errno == EINPROGRESS ) ) {
        break;
      }
      throw unix_error { "write" };
    }

    if ( bytes_written == 0 ) {
      throw runtime_error( "write returned 0 given non-empty input buffer" );
    }

    register_write();
    total_written += bytes_written;
    buffer.remove_prefix( bytes_written );

    if ( internal_fd_->non_blocking_ ) {
      break;
    }
  }

  return total_written;
}

void FileDescriptor::set_blocking( const bool blocking )
{
  int flags = CheckSystemCall( "fcntl", fcntl( fd_num(), F_GETFL ) );
  if ( blocking ) {
    flags ^= ( flags & O_NONBLOCK );
  } else {
    flags |= O_NONBLOCK;
  }

  CheckSystemCall( "fcntl", fcntl( fd_num(), F_SETFL, flags ) );

  internal_fd_->non_blocking_ = not blocking;
}

static pair<FileDescriptor, FileDescriptor> make_pipe()
{
  int fds[2];
  CheckSystemCall( "pipe2", pipe2( fds, O_NONBLOCK | O_CLOEXEC ) );
  return { FileDescriptor { fds[0] }, FileDescriptor { fds[1] } };
}

WakeupPipe::WakeupPipe( pair<FileDescriptor, FileDescriptor> ends )
  : read_end_( move( ends.first ) )
  , write_end_( move( ends.second ) )
{}

WakeupPipe::WakeupPipe()
  : WakeupPipe( make_pipe() )
{}

void WakeupPipe::notify()
{
  /* a full pipe already guarantees a wakeup */
  write_end_.write( "x" );
}

void WakeupPipe::drain()
{
  string discard;
  while ( true ) {
    const size_t before = discard.size();
    read_end_.read( discard );
    if ( discard.size() == before or read_end_.eof() ) {
      break;
    }
    discard.clear();
  }
}
