/*
 * Copyright 2015 Georgia Institute of Technology
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file    file.hpp
 * @ingroup io
 * @author  tpan
 * @brief   read-only memory mapped file access.
 * @details mapped_data owns one mmap region.  mmap_file owns the file descriptor and hands out
 *          mapped_data for byte ranges of the file.
 *
 *  mapping flags:  MAP_SHARED so there is no copy on write, and MAP_NORESERVE so no swap is
 *  reserved.  MAP_POPULATE is not used; madvise(MADV_SEQUENTIAL) asks for read ahead instead.
 *  each region is mapped from a page aligned offset at or before the requested start.
 */

#ifndef FILE_HPP_
#define FILE_HPP_

#include <string>
#include <cstring>      // strerror
#include <cerrno>
#include <sstream>      // stringstream

#include <unistd.h>     // sysconf, close
#include <sys/mman.h>   // mmap
#include <sys/stat.h>   // stat64
#include <fcntl.h>      // open64

#include "io/io_exception.hpp"
#include "partition/range.hpp"
#include "utils/exception_handling.hpp"
#include "utils/logging.h"

namespace fastmap {

namespace io {

/**
 * @brief mmapped data.  move-only owner of a single mapping, unmapped on destruction.
 */
class mapped_data {
  public:
    /// range type
    typedef ::fastmap::partition::range<size_t> range_type;

  protected:
    /// pointer to mapped address.  page aligned.
    unsigned char * data;

    /// mapped range in file coordinates.  start is page aligned.
    range_type range_bytes;

    size_t page_size;

    void unmap() {
      if ((data != nullptr) && (range_bytes.size() > 0)) {
        if (munmap(data, range_bytes.size()) == -1) {
          int myerr = errno;
          FM_WARNING("munmap of " << range_bytes << " failed: " << myerr << ": " << strerror(myerr));
        }
      }
      data = nullptr;
      range_bytes.start = range_bytes.end;
    }

  public:

    /// empty mapping
    mapped_data() : data(nullptr), range_bytes(0, 0), page_size(sysconf(_SC_PAGE_SIZE)) {}

    /**
     * @brief   map the specified portion of the file to memory.
     * @param _fd       open file descriptor
     * @param target    range of the file to map.  the mapping starts at the page boundary at or before target.start
     */
    mapped_data(int const & _fd, range_type const & target) :
      data(nullptr), range_bytes(0, 0),
      page_size(sysconf(_SC_PAGE_SIZE))
    {
      if (_fd == -1) {
        throw ::fastmap::utils::make_exception<IOException>(IOErrorType::MMAP_FILE, "ERROR: map: file is not yet open.");
      }

      if (target.size() == 0) {
        FM_WARNING("map: zero bytes in range " << target);
        range_bytes.start = range_bytes.end = target.start;
        return;
      }

      range_bytes.start = range_type::align_to_page(target, page_size);
      range_bytes.end = target.end;  // end does not need to be aligned.

      void * mapped = mmap64(nullptr, range_bytes.size(),
                             PROT_READ,
                             MAP_SHARED | MAP_NORESERVE, _fd,
                             range_bytes.start);

      if (mapped == MAP_FAILED)
      {
        std::stringstream ss;
        int myerr = errno;
        ss << "ERROR in mmap of " << range_bytes << ": " << myerr << ": " << strerror(myerr);
        range_bytes.start = range_bytes.end;
        throw ::fastmap::utils::make_exception<IOException>(IOErrorType::MMAP_FILE, ss.str());
      }
      data = static_cast<unsigned char *>(mapped);

      // advisory only.
      if (madvise(data, range_bytes.size(), MADV_SEQUENTIAL) == -1) {
        int myerr = errno;
        FM_WARNING("madvise on " << range_bytes << " failed: " << myerr << ": " << strerror(myerr));
      }
    }

    ~mapped_data() {
      unmap();
    }

    // copy constructor and assignment operators are deleted.
    mapped_data(mapped_data const & other) = delete;
    mapped_data& operator=(mapped_data const & other) = delete;

    mapped_data(mapped_data && other) :
      data(other.data), range_bytes(other.range_bytes), page_size(other.page_size) {

      other.data = nullptr;
      other.range_bytes.start = other.range_bytes.end;
    }
    mapped_data& operator=(mapped_data && other) {
      if (this != &other) {
        unmap();

        data = other.data;      other.data = nullptr;
        range_bytes = other.range_bytes;   other.range_bytes.start = other.range_bytes.end;
        page_size = other.page_size;
      }
      return *this;
    }

    /// start of the mapping.  corresponds to get_range().start in the file.
    const unsigned char * get_data() const {
      return data;
    }

    /// mapped range in file coordinates
    range_type const & get_range() const {
      return range_bytes;
    }

    /// get the size of this mapping.
    size_t size() const {
      return range_bytes.size();
    }

    size_t get_page_size() const {
      return page_size;
    }
};



/**
 * @brief  read-only file opened for memory mapping.
 * @details the size is queried with stat64 before the file is opened, so a missing path is
 *          reported as METADATA_FILE and a path that exists but cannot be opened as OPEN_FILE.
 */
class mmap_file {

public:
	typedef ::fastmap::partition::range<size_t> range_type;

protected:
	/// name of file.
	std::string filename;

	/// file descriptor
	int fd;

	/// [0, file size)
	range_type file_range_bytes;

	size_t get_file_size() {
		struct stat64 filestat;
		int ret = stat64(filename.c_str(), &filestat);

		if (ret < 0) {
			::std::stringstream ss;
			int myerr = errno;
			ss << "ERROR : fastmap::io::mmap_file::get_file_size: ["  << filename << "] " << myerr << ": " << strerror(myerr);
			throw ::fastmap::utils::make_exception<IOException>(IOErrorType::METADATA_FILE, ss.str());
		}

		return static_cast<size_t>(filestat.st_size);
	}

  void open_file() {
    this->fd = open64(this->filename.c_str(), O_RDONLY);
    if (this->fd == -1)
    {
      ::std::stringstream ss;
      int myerr = errno;
      ss << "ERROR in mmap_file open: ["  << this->filename << "] error " << myerr << ": " << strerror(myerr);
      throw ::fastmap::utils::make_exception<IOException>(IOErrorType::OPEN_FILE, ss.str());
    }
  }

  void close_file() {
    if (this->fd >= 0) {
      close(this->fd);
      this->fd = -1;
    }
  }

public:

	/**
	 * @brief opens a file for mapping
	 * @param _filename 	name of file to open
	 */
	explicit mmap_file(std::string const & _filename) :
		filename(_filename), fd(-1), file_range_bytes(0, 0) {
		this->file_range_bytes.end = this->get_file_size();
	  this->open_file();
	}

	~mmap_file() {
    this->close_file();
	}

	mmap_file(mmap_file const & other) = delete;
	mmap_file& operator=(mmap_file const & other) = delete;

	/// map a range of the file.  the range is clipped to the file.
	mapped_data map(range_type const & range_bytes) const {
	  return mapped_data(this->fd, range_type::intersect(range_bytes, this->file_range_bytes));
	}

	/// get file size
	size_t size() const {
		return file_range_bytes.end;
	}

	range_type const & get_range() const {
	  return file_range_bytes;
	}

	/// get file name
	::std::string const & get_filename() const { return filename; };
};


} /* namespace io */
} /* namespace fastmap */

#endif /* FILE_HPP_ */
