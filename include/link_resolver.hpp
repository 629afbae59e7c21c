#pragma once

#include "config.hpp"
#include "http_transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * What a HEAD probe of a direct link tells us.
 */
struct ProbeResult
{
    std::optional<std::uint64_t> size;
    std::string name;
};

/**
 * Turns a provider page URL into a short-lived direct download URL.
 */
class LinkResolver
{
public:
    virtual ~LinkResolver() = default;

    /**
     * @throws DownloadError with kind Resolve (denied, quota exhausted), NotFound, or TransientNetwork
     */
    virtual std::string resolve(const std::string &target) = 0;

    /**
     * @throws DownloadError with kind NotFound when the link points at nothing
     */
    virtual ProbeResult probe(const std::string &directUrl) = 0;
};

/**
 * Resolver for the provider's VIP download API.
 */
class VipLinkResolver : public LinkResolver
{
public:
    VipLinkResolver(HttpTransport &transport, ProviderSettings settings);

    std::string resolve(const std::string &target) override;
    ProbeResult probe(const std::string &directUrl) override;

private:
    HttpTransport &transport_;
    ProviderSettings settings_;
};

/**
 * Extract the filename from a Content-Disposition value ("" if none).
 * Handles filename="..." and RFC 5987 filename*=UTF-8''... forms.
 */
std::string filenameFromContentDisposition(std::string_view header);
