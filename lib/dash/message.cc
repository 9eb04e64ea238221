#include "dash/message.hpp"
#include "dash/art.hpp"
#include "dash/endian.hpp"
#include <algorithm>
#include <boost/locale.hpp>
#include <cstdlib>
#include <ctime>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <limits.h>
#include <string.h>
#include <unistd.h>

namespace dash
{

void decode_json(const std::string &json, google::protobuf::Message &msg)
{
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, &msg, options);
    if (!status.ok())
        throw dash_protocol_exception(status.ToString(), protocol_error::bad_json);
}

std::string encode_json(const google::protobuf::Message &msg)
{
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(msg, &json, options);
    if (!status.ok())
        throw dash_param_exception("can't encode " + msg.GetTypeName() + ": " + status.ToString());
    return json;
}

static std::string normalize(const std::string &str)
{
    u64 begin = 0, end = str.size();
    while (begin < end && (unsigned char)str[begin] <= ' ')
        begin++;
    while (end > begin && (unsigned char)str[end - 1] <= ' ')
        end--;
    // fixed english locale, the peer lowercases the same way whatever the host locale is
    static const std::locale english = boost::locale::generator()("en_US.UTF-8");
    return boost::locale::to_lower(str.substr(begin, end - begin), english);
}

art_hash_t art_hash(const std::string &artist, const std::string &album)
{
    auto key = normalize(artist) + "|" + normalize(album);
    return crc32((const byte *)key.data(), key.size());
}

std::string hash_string(art_hash_t hash) { return std::to_string(hash); }

std::optional<art_hash_t> parse_hash_string(const std::string &str)
{
    if (str.empty() || str.size() > 10)
        return {};
    for (char c : str)
    {
        if (c < '0' || c > '9')
            return {};
    }
    unsigned long long value = std::strtoull(str.c_str(), nullptr, 10);
    if (value > 0xFFFFFFFFULL)
        return {};
    return (art_hash_t)value;
}

proto::MediaState empty_media_state()
{
    proto::MediaState state;
    state.set_is_playing(false);
    state.set_playback_state("stopped");
    return state;
}

buffer_t encode_media_channels(const std::vector<std::string> &channels)
{
    u64 count = channels.size() > 0xFFFF ? 0xFFFF : channels.size();
    u64 length = 2;
    for (u64 i = 0; i < count; i++)
    {
        length += 1 + std::min<u64>(channels[i].size(), 0xFF);
    }

    buffer_t buffer(length);
    byte *ptr = buffer.get();
    endian::put_big_u16(count, ptr);
    ptr += 2;
    for (u64 i = 0; i < count; i++)
    {
        u64 len = std::min<u64>(channels[i].size(), 0xFF);
        *ptr++ = len;
        memcpy(ptr, channels[i].data(), len);
        ptr += len;
    }
    return buffer;
}

std::vector<std::string> decode_media_channels(const buffer_t &bytes)
{
    const byte *ptr = bytes.get();
    u64 rest = bytes.get_length();
    if (rest < 2)
        throw dash_protocol_exception("media channel list without count", protocol_error::truncated);
    u16 count = endian::get_big_u16(ptr);
    ptr += 2;
    rest -= 2;

    std::vector<std::string> channels;
    channels.reserve(count);
    for (u16 i = 0; i < count; i++)
    {
        if (rest < 1 || rest - 1 < *ptr)
            throw dash_protocol_exception("media channel name truncated", protocol_error::truncated);
        u64 len = *ptr;
        channels.emplace_back((const char *)ptr + 1, len);
        ptr += 1 + len;
        rest -= 1 + len;
    }
    return channels;
}

std::vector<proto::LyricsChunk> make_lyrics_chunks(const std::string &hash, bool synced,
                                                   const std::vector<lyrics_line_t> &lines, u32 lines_per_chunk)
{
    if (lines_per_chunk == 0)
        throw dash_param_exception("lyrics chunk must hold at least one line");

    u64 total = (lines.size() + lines_per_chunk - 1) / lines_per_chunk;
    std::vector<proto::LyricsChunk> chunks;
    chunks.reserve(total);
    for (u64 i = 0; i < total; i++)
    {
        proto::LyricsChunk chunk;
        chunk.set_h(hash);
        chunk.set_s(synced);
        chunk.set_n(lines.size());
        chunk.set_c(i);
        chunk.set_m(total);
        for (u64 j = i * lines_per_chunk; j < lines.size() && j < (i + 1) * lines_per_chunk; j++)
        {
            auto line = chunk.add_l();
            line->set_t(lines[j].time);
            line->set_l(lines[j].text);
        }
        chunks.emplace_back(std::move(chunk));
    }
    return chunks;
}

proto::LyricsChunk lyrics_clear_chunk(const std::string &hash)
{
    proto::LyricsChunk chunk;
    chunk.set_h(hash);
    chunk.set_s(false);
    chunk.set_n(0);
    chunk.set_c(0);
    chunk.set_m(1);
    return chunk;
}

buffer_t encode_settings(const std::map<std::string, setting_value_t> &settings)
{
    google::protobuf::Struct object;
    auto &fields = *object.mutable_fields();
    for (auto &it : settings)
    {
        auto &value = fields[it.first];
        if (auto b = std::get_if<bool>(&it.second))
            value.set_bool_value(*b);
        else if (auto d = std::get_if<double>(&it.second))
            value.set_number_value(*d);
        else
            value.set_string_value(std::get<std::string>(it.second));
    }
    return to_buffer(object);
}

std::string time_sync_text(i64 unix_seconds, int offset_minutes, const std::string &zone)
{
    return std::to_string(unix_seconds) + "|" + std::to_string(offset_minutes) + "|" + zone;
}

std::string current_time_sync()
{
    time_t now = time(nullptr);
    struct tm local;
    int offset = 0;
    if (localtime_r(&now, &local) != nullptr)
        offset = local.tm_gmtoff / 60;
    return time_sync_text(now, offset, local_zone_id());
}

std::string local_zone_id()
{
    const char *tz = getenv("TZ");
    if (tz != nullptr && tz[0] != 0)
        return tz[0] == ':' ? std::string(tz + 1) : std::string(tz);

    char path[PATH_MAX];
    auto len = readlink("/etc/localtime", path, sizeof(path) - 1);
    if (len > 0)
    {
        std::string target(path, len);
        auto pos = target.find("zoneinfo/");
        if (pos != std::string::npos)
            return target.substr(pos + 9);
    }
    return "UTC";
}

} // namespace dash
