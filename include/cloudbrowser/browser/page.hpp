#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "cloudbrowser/browser/cdp_client.hpp"
#include "cloudbrowser/browser/provisioning.hpp"
#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::browser {

/// One browser tab attached in flattened mode with request interception on.
///
/// fetch() navigates the tab and captures the first non-redirect response
/// of the document, applying the caller's method, headers and body to the
/// navigation request.
class Page {
public:
    /// Open a blank target on the browser behind cdp and attach to it.
    static auto open(std::shared_ptr<CdpClient> cdp) -> awaitable<Result<Page>>;

    auto fetch(const PageRequest& req) -> awaitable<Result<PageResponse>>;

    /// Close the target. The page must not be used afterwards.
    auto close() -> awaitable<Result<void>>;

    [[nodiscard]] auto target_id() const -> const std::string& { return target_id_; }
    [[nodiscard]] auto session_id() const -> const std::string& { return session_id_; }

private:
    Page(std::shared_ptr<CdpClient> cdp, std::string target_id,
         std::string session_id);

    std::shared_ptr<CdpClient> cdp_;
    std::string target_id_;
    std::string session_id_;
};

/// Map a CDP transport error to the fetch error taxonomy: a lost DevTools
/// connection means the session is broken, anything else is a page failure.
auto to_fetch_error(const Error& error) -> Error;

} // namespace cloudbrowser::browser
