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
 * \file storage/persistentcache.hpp
 *
 * Durable key -> cache entry store.
 *
 * Every entry lives in its own file under a two-level hashed directory tree.
 * Entries are written into a temporary file and renamed over the destination
 * so readers never see a partial entry. Each file carries a CRC so a damaged
 * file is treated as missing.
 */

#ifndef slmaplibs_storage_persistentcache_hpp_included_
#define slmaplibs_storage_persistentcache_hpp_included_

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "freshness.hpp"

namespace slmaplibs { namespace storage {

class PersistentCache : boost::noncopyable {
public:
    /** Opens (and creates if needed) cache at given root directory.
     *  Throws CacheIOError when the directory cannot be created.
     */
    PersistentCache(const boost::filesystem::path &root);

    /** Returns cached entry or none if not cached (or damaged).
     */
    boost::optional<CacheEntry> get(const std::string &key) const;

    /** Atomically stores (replaces) entry.
     */
    void put(const std::string &key, const CacheEntry &entry);

    const boost::filesystem::path& root() const { return root_; }

    /** Path to entry file. Exposed for diagnostics.
     */
    boost::filesystem::path filePath(const std::string &key) const;

private:
    const boost::filesystem::path root_;
};

} } // namespace slmaplibs::storage

#endif // slmaplibs_storage_persistentcache_hpp_included_
