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
#include <cstring>
#include <fstream>
#include <sstream>
#include <iterator>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/crc.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/binaryio.hpp"
#include "utility/path.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/io.hpp"

#include "error.hpp"
#include "persistentcache.hpp"

namespace fs = boost::filesystem;
namespace bin = utility::binaryio;

namespace slmaplibs { namespace storage {

namespace {

const char PC_MAGIC[4] = { 'S', 'L', 'M', 'C' };
const std::uint8_t PC_VERSION(1);

// magic + version + meta size + payload size + crc
const std::size_t MinFileSize(sizeof(PC_MAGIC) + 1 + 4 + 8 + 4);

std::uint32_t calculateHash(const char *data, std::size_t size)
{
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}

fs::path dir(const std::string &key)
{
    const auto hash(calculateHash(key.data(), key.size()));
    return str(boost::format("%02x") % ((hash >> 24) & 0xff));
}

bool safeChar(char c)
{
    return (((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z'))
            || ((c >= '0') && (c <= '9')) || (c == '-') || (c == '_')
            || (c == '.'));
}

std::string filename(const std::string &key)
{
    std::string out;
    for (char c : key) {
        if (safeChar(c)) {
            out.push_back(c);
        } else {
            out.append(str(boost::format("%%%02X")
                           % unsigned(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

std::string serialize(const CacheEntry &entry)
{
    Json::Value meta(Json::objectValue);
    if (entry.etag) { meta["etag"] = *entry.etag; }
    if (entry.lastModified) {
        meta["lastModified"] = Json::Int64(*entry.lastModified);
    }
    if (entry.expires) { meta["expires"] = Json::Int64(*entry.expires); }
    meta["stored"] = Json::Int64(entry.stored);
    meta["absent"] = entry.absent;

    std::ostringstream ms;
    Json::write(ms, meta);
    const auto metaStr(ms.str());

    std::ostringstream os;
    os.exceptions(std::ostream::failbit | std::ostream::badbit);

    bin::write(os, PC_MAGIC, sizeof(PC_MAGIC));
    bin::write(os, PC_VERSION);
    bin::write(os, std::uint32_t(metaStr.size()));
    bin::write(os, metaStr.data(), metaStr.size());
    bin::write(os, std::uint64_t(entry.payload.size()));
    bin::write(os, entry.payload.data(), entry.payload.size());

    auto raw(os.str());
    const auto crc(calculateHash(raw.data(), raw.size()));

    std::ostringstream cs;
    cs.exceptions(std::ostream::failbit | std::ostream::badbit);
    bin::write(cs, crc);
    raw.append(cs.str());

    return raw;
}

boost::optional<CacheEntry> deserialize(const std::string &raw
                                        , const fs::path &path)
{
    if (raw.size() < MinFileSize) {
        LOG(warn3) << "Cache file " << path << " is truncated; ignoring.";
        return boost::none;
    }

    const auto bodySize(raw.size() - 4);
    std::uint32_t storedCrc;
    {
        std::istringstream cs(raw.substr(bodySize));
        cs.exceptions(std::istream::failbit | std::istream::badbit);
        bin::read(cs, storedCrc);
    }

    if (storedCrc != calculateHash(raw.data(), bodySize)) {
        LOG(warn3) << "Cache file " << path
                   << " has invalid checksum; ignoring.";
        return boost::none;
    }

    std::istringstream is(raw.substr(0, bodySize));
    is.exceptions(std::istream::failbit | std::istream::badbit);

    try {
        char magic[sizeof(PC_MAGIC)];
        bin::read(is, magic);
        if (std::memcmp(magic, PC_MAGIC, sizeof(PC_MAGIC))) {
            LOG(warn3) << "Cache file " << path
                       << " has invalid magic; ignoring.";
            return boost::none;
        }

        std::uint8_t version;
        bin::read(is, version);
        if (version != PC_VERSION) {
            LOG(warn3) << "Cache file " << path
                       << " has unsupported version " << int(version)
                       << "; ignoring.";
            return boost::none;
        }

        std::uint32_t metaSize;
        bin::read(is, metaSize);
        std::string metaStr(metaSize, '\0');
        if (metaSize) { bin::read(is, &metaStr[0], metaSize); }

        std::uint64_t payloadSize;
        bin::read(is, payloadSize);
        if (payloadSize > bodySize) {
            LOG(warn3) << "Cache file " << path
                       << " has invalid payload size; ignoring.";
            return boost::none;
        }

        CacheEntry entry;
        entry.payload.resize(payloadSize);
        if (payloadSize) { bin::read(is, &entry.payload[0], payloadSize); }

        std::istringstream ms(metaStr);
        const auto meta(Json::read<FormatError>(ms, path, "cache entry"));

        if (meta.isMember("etag")) { entry.etag = meta["etag"].asString(); }
        if (meta.isMember("lastModified")) {
            entry.lastModified = std::time_t(meta["lastModified"].asInt64());
        }
        if (meta.isMember("expires")) {
            entry.expires = std::time_t(meta["expires"].asInt64());
        }
        entry.stored = std::time_t(meta["stored"].asInt64());
        entry.absent = meta["absent"].asBool();

        return entry;

    } catch (const std::ios_base::failure &e) {
        LOG(warn3) << "Cache file " << path << " is damaged <"
                   << e.what() << ">; ignoring.";
    } catch (const FormatError &e) {
        LOG(warn3) << "Cache file " << path << " has invalid metadata <"
                   << e.what() << ">; ignoring.";
    } catch (const Json::Exception &e) {
        LOG(warn3) << "Cache file " << path << " has invalid metadata <"
                   << e.what() << ">; ignoring.";
    }

    return boost::none;
}

} // namespace

PersistentCache::PersistentCache(const fs::path &root)
    : root_(root)
{
    boost::system::error_code ec;
    create_directories(root_, ec);
    if (ec && !is_directory(root_)) {
        LOGTHROW(err2, CacheIOError)
            << "Unable to create cache directory " << root_ << ": <"
            << ec.message() << ">.";
    }
    LOG(info1) << "Using map cache at " << root_ << ".";
}

fs::path PersistentCache::filePath(const std::string &key) const
{
    return root_ / dir(key) / filename(key);
}

boost::optional<CacheEntry> PersistentCache::get(const std::string &key)
    const
{
    const auto path(filePath(key));

    boost::system::error_code ec;
    if (!exists(path, ec)) {
        LOG(debug) << "Cache miss for <" << key << ">.";
        return boost::none;
    }

    std::string raw;
    try {
        std::ifstream f;
        f.exceptions(std::ios::badbit | std::ios::failbit);
        f.open(path.string(), std::ios_base::in | std::ios_base::binary);
        f.exceptions(std::ios::badbit);
        raw.assign(std::istreambuf_iterator<char>(f)
                   , std::istreambuf_iterator<char>());
    } catch (const std::exception &e) {
        // file vanished between exists() and open(): plain miss
        if (!exists(path, ec)) { return boost::none; }
        LOGTHROW(err2, CacheIOError)
            << "Unable to read cache file " << path << ": <"
            << e.what() << ">.";
    }

    auto entry(deserialize(raw, path));
    if (entry) { LOG(debug) << "Cache hit for <" << key << ">."; }
    return entry;
}

void PersistentCache::put(const std::string &key, const CacheEntry &entry)
{
    const auto path(filePath(key));
    const auto tmpPath
        (utility::addExtension(path, ".tmp-" + fs::unique_path().string()));

    const auto raw(serialize(entry));

    try {
        boost::system::error_code ec;
        create_directories(path.parent_path(), ec);

        std::ofstream f;
        f.exceptions(std::ios::badbit | std::ios::failbit);
        f.open(tmpPath.string(), std::ios_base::out | std::ios_base::trunc
               | std::ios_base::binary);
        f.write(raw.data(), raw.size());
        f.close();

        // atomic from the reader's point of view
        fs::rename(tmpPath, path);
    } catch (const std::exception &e) {
        boost::system::error_code ec;
        fs::remove(tmpPath, ec);
        LOGTHROW(err2, CacheIOError)
            << "Unable to store cache file " << path << ": <"
            << e.what() << ">.";
    }

    LOG(debug) << "Stored <" << key << "> " << entry << " in " << path << ".";
}

} } // namespace slmaplibs::storage
