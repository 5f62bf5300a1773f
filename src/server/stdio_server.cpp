#include "searxmcp/server/stdio_server.hpp"

#include "searxmcp/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <spdlog/spdlog.h>

namespace searxmcp::server
{

namespace
{

std::string trim(const std::string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<std::string> FrameReader::read()
{
    std::optional<std::string> content_length;
    std::string line;

    while (true)
    {
        if (!std::getline(in_, line))
            return std::nullopt;
        line = trim(line);
        if (line.empty())
            break;
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        if (to_lower(trim(line.substr(0, colon))) == "content-length")
            content_length = trim(line.substr(colon + 1));
    }

    if (!content_length)
        return std::nullopt;

    std::size_t length = 0;
    try
    {
        size_t used = 0;
        unsigned long long parsed = std::stoull(*content_length, &used);
        if (used != content_length->size())
            return std::nullopt;
        length = static_cast<std::size_t>(parsed);
    }
    catch (const std::exception&)
    {
        spdlog::warn("Invalid Content-Length header: {}", *content_length);
        return std::nullopt;
    }

    if (length == 0)
        return std::nullopt;
    if (length > MAX_CONTENT_LENGTH)
    {
        spdlog::warn("Content-Length {} exceeds max {}", length, MAX_CONTENT_LENGTH);
        return std::nullopt;
    }

    std::string body(length, '\0');
    in_.read(&body[0], static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in_.gcount()) != length)
    {
        spdlog::warn("Unexpected EOF while reading body ({} of {} bytes)", in_.gcount(), length);
        return std::nullopt;
    }
    return body;
}

std::string FrameWriter::frame(const std::string& body)
{
    std::string header = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    std::string out;
    out.reserve(header.size() + body.size());
    out.append(header);
    out.append(body);
    return out;
}

void FrameWriter::write_raw(const std::string& body)
{
    std::string data = frame(body);
    std::lock_guard<std::mutex> lock(m_);
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    out_.flush();
}

void FrameWriter::write(const Json& message)
{
    write_raw(util::json::dump(message));
}

StdioServerWrapper::StdioServerWrapper(mcp::McpHandler handler)
    : StdioServerWrapper(std::move(handler), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(mcp::McpHandler handler, std::istream& in,
                                       std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

std::size_t StdioServerWrapper::run()
{
    running_ = true;
    FrameReader reader(in_);
    FrameWriter writer(out_);
    std::size_t answered = 0;

    spdlog::info("Stdio transport started");

    while (auto body = reader.read())
    {
        Json response;
        try
        {
            auto request = util::json::parse(*body);
            response = handler_(request);
        }
        catch (const Json::parse_error& e)
        {
            spdlog::warn("Malformed JSON-RPC frame: {}", e.what());
            response = mcp::parse_error_response();
        }

        writer.write(response);
        if (!out_)
        {
            spdlog::error("Output stream failed; ending stdio session");
            break;
        }
        ++answered;
    }

    spdlog::info("Stdio transport finished ({} messages)", answered);
    running_ = false;
    return answered;
}

} // namespace searxmcp::server
