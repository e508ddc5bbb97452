#include <mdtypst/package-fetcher.h>
#include <cpr/cpr.h>
#include <ytrace/ytrace.hpp>

namespace mdtypst {

//=============================================================================
// HttpPackageFetcher
//=============================================================================

class HttpPackageFetcher : public PackageFetcher {
public:
    explicit HttpPackageFetcher(std::string registry) : _registry(std::move(registry)) {}
    ~HttpPackageFetcher() override = default;

    Result<void> init() {
        if (_registry.empty()) {
            return Err<void>("package registry URL is empty");
        }
        if (_registry.rfind("http://", 0) != 0 && _registry.rfind("https://", 0) != 0) {
            return Err<void>("package registry must be an http(s) URL: " + _registry);
        }
        while (_registry.back() == '/') _registry.pop_back();
        return Ok();
    }

    std::string archiveUrl(const PackageKey& key) const override {
        return _registry + "/" + key.ns + "/" + key.name + "-" + key.version + ".tar.gz";
    }

    Result<std::string> fetch(const PackageKey& key) override {
        std::string url = archiveUrl(key);
        yinfo("PackageFetcher::fetch: {}", url);

        // one session per request: fetches run on several worker threads
        cpr::Session session;
        session.SetUrl(cpr::Url{url});
        session.SetUserAgent(cpr::UserAgent{"mdtypst/1.0"});
        session.SetTimeout(cpr::Timeout{60000});
        session.SetConnectTimeout(cpr::ConnectTimeout{10000});
        session.SetRedirect(cpr::Redirect{10L});
        cpr::Response r = session.Get();

        if (r.status_code == 0) {
            yerror("PackageFetcher::fetch: connection failed: {}", r.error.message);
            return Err<std::string>("failed to download package " + key.toString() + ": " +
                                    r.error.message);
        }
        if (r.status_code < 200 || r.status_code >= 300) {
            ywarn("PackageFetcher::fetch: HTTP {}: {}", r.status_code, url);
            return Err<std::string>("failed to download package " + key.toString() + ": HTTP " +
                                    std::to_string(r.status_code));
        }

        yinfo("PackageFetcher::fetch: OK {} ({} bytes)", r.status_code, r.text.size());
        return Ok(std::move(r.text));
    }

private:
    std::string _registry;
};

//=============================================================================
// Factory
//=============================================================================

Result<PackageFetcher::Ptr> PackageFetcher::create(const std::string& registry) {
    auto impl = std::make_shared<HttpPackageFetcher>(registry);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create PackageFetcher", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace mdtypst
