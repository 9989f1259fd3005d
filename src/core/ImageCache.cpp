#include "core/ImageCache.hpp"
#include "core/Errors.hpp"
#include "core/Normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <system_error>
#include <gdk-pixbuf/gdk-pixbuf.h>

namespace newsfeed {
namespace core {

namespace {

const char* const kImageAccept = "image/avif, image/webp, image/png, image/jpeg, image/*;q=0.8";

struct ObjectDeleter {
    void operator()(gpointer object) const { g_object_unref(object); }
};

using LoaderPtr = std::unique_ptr<GdkPixbufLoader, ObjectDeleter>;

// Returns the message and frees the error.
std::string takeMessage(GError*& error) {
    std::string message = (error && error->message) ? error->message : "unknown error";
    if (error) {
        g_error_free(error);
        error = nullptr;
    }
    return message;
}

// gdk-pixbuf saver for the file name, else the source format if it can be
// written, else PNG.
std::string outputFormat(const std::filesystem::path& target, GdkPixbufFormat* source) {
    std::string ext = target.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".png") return "png";
    if (ext == ".jpg" || ext == ".jpeg") return "jpeg";
    if (ext == ".bmp") return "bmp";
    if (ext == ".ico") return "ico";
    if (ext == ".tif" || ext == ".tiff") return "tiff";

    if (source && gdk_pixbuf_format_is_writable(source)) {
        gchar* name = gdk_pixbuf_format_get_name(source);
        std::string format = name ? name : "png";
        g_free(name);
        return format;
    }
    return "png";
}

} // namespace

ImageCache::ImageCache(const std::filesystem::path& cacheRoot, HttpClient& client, WorkerPool& pool)
    : cacheRoot_(cacheRoot), client_(client), pool_(pool) {}

std::optional<std::filesystem::path> ImageCache::pathFor(const std::string& url) const {
    return imagePathForUrl(cacheRoot_, url);
}

std::vector<ImageOutcome> ImageCache::ensureCached(const std::vector<std::string>& urls) {
    std::set<std::filesystem::path> seenPaths;
    std::vector<ImageOutcome> outcomes;
    std::vector<std::future<ImageOutcome>> pending;

    for (const auto& url : urls) {
        auto path = pathFor(url);
        if (!path) {
            ImageOutcome outcome;
            outcome.url = url;
            outcome.error = "URL does not map to a cache path";
            outcomes.push_back(outcome);
            continue;
        }
        if (!seenPaths.insert(*path).second) {
            continue;
        }
        pending.push_back(pool_.submit([this, url]() { return cacheOne(url); }));
    }

    for (auto& job : pending) {
        outcomes.push_back(job.get());
    }
    return outcomes;
}

ImageOutcome ImageCache::cacheOne(const std::string& url) {
    ImageOutcome outcome;
    outcome.url = url;

    auto path = pathFor(url);
    if (!path) {
        outcome.error = "URL does not map to a cache path";
        return outcome;
    }
    outcome.path = *path;

    std::error_code ec;
    if (std::filesystem::exists(outcome.path, ec)) {
        outcome.status = ImageStatus::AlreadyCached;
        return outcome;
    }

    try {
        download(url, outcome.path);
        outcome.status = ImageStatus::Downloaded;
    } catch (const ImageFetchError& e) {
        std::cerr << "Error caching image " << url << ": " << e.what() << "\n";
        outcome.error = e.what();
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error caching image " << url << ": " << e.what() << "\n";
        outcome.error = e.what();
    }
    return outcome;
}

void ImageCache::download(const std::string& url, const std::filesystem::path& target) {
    HttpResponse response = client_.get(url, kImageAccept);
    if (!response.ok()) {
        std::stringstream err;
        err << "Failed to fetch image: HTTP " << response.statusCode;
        if (!response.error.empty()) {
            err << " (" << response.error << ")";
        }
        throw ImageFetchError(url, err.str());
    }
    if (response.body.empty()) {
        throw ImageFetchError(url, "Empty response received from image URL");
    }

    storeImage(url, response.body, target);
}

void ImageCache::storeImage(const std::string& url, const std::string& bytes,
                            const std::filesystem::path& target) {
    LoaderPtr loader(gdk_pixbuf_loader_new());
    GError* error = nullptr;

    if (!gdk_pixbuf_loader_write(loader.get(), reinterpret_cast<const guchar*>(bytes.data()),
                                 bytes.size(), &error)) {
        std::string reason = takeMessage(error);
        // The loader must be closed even after a failed write; its own error adds nothing.
        GError* closeError = nullptr;
        if (!gdk_pixbuf_loader_close(loader.get(), &closeError)) {
            takeMessage(closeError);
        }
        throw ImageFetchError(url, "Could not decode image: " + reason);
    }
    if (!gdk_pixbuf_loader_close(loader.get(), &error)) {
        throw ImageFetchError(url, "Could not decode image: " + takeMessage(error));
    }

    GdkPixbuf* pixbuf = gdk_pixbuf_loader_get_pixbuf(loader.get());
    if (!pixbuf) {
        throw ImageFetchError(url, "Could not decode image: no frame produced");
    }

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw ImageFetchError(url, "Could not create " + target.parent_path().string() + ": " + ec.message());
    }

    const std::string format = outputFormat(target, gdk_pixbuf_loader_get_format(loader.get()));
    std::filesystem::path partial = target;
    partial += ".part";

    if (!gdk_pixbuf_save(pixbuf, partial.c_str(), format.c_str(), &error, static_cast<char*>(nullptr))) {
        std::string reason = takeMessage(error);
        std::filesystem::remove(partial, ec);
        throw ImageFetchError(url, "Could not write " + format + " image: " + reason);
    }

    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(partial, ec);
        throw ImageFetchError(url, "Could not move image into place: " + reason);
    }
}

} // namespace core
} // namespace newsfeed
