/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
/**
 * \file storage/error.hpp
 *
 * Map cache error types.
 */

#ifndef slmaplibs_storage_error_hpp_included_
#define slmaplibs_storage_error_hpp_included_

#include <stdexcept>
#include <string>

namespace slmaplibs { namespace storage {

struct Error : std::runtime_error {
    Error(const std::string &message) : std::runtime_error(message) {}
};

/** Authoritative answer: no such region exists.
 */
struct NoSuchRegion : Error {
    NoSuchRegion(const std::string &message) : Error(message) {}
};

/** Network or service failure that is worth retrying.
 */
struct TransientError : Error {
    TransientError(const std::string &message) : Error(message) {}
};

/** Remote side answered with a status we cannot interpret.
 */
struct UnexpectedResponse : Error {
    UnexpectedResponse(const std::string &message) : Error(message) {}
};

/** Local cache storage is unusable.
 */
struct CacheIOError : Error {
    CacheIOError(const std::string &message) : Error(message) {}
};

struct InvalidRectangle : Error {
    InvalidRectangle(const std::string &message) : Error(message) {}
};

struct FormatError : Error {
    FormatError(const std::string &message) : Error(message) {}
};

struct Interrupted : Error {
    Interrupted(const std::string &message) : Error(message) {}
};

} } // namespace slmaplibs::storage

#endif // slmaplibs_storage_error_hpp_included_
