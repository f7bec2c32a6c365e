#pragma once

#include "error_util.hpp"

#include <dlfcn.h>
#include <functional>
#include <initializer_list>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace HWENC {

using void_ptr = std::unique_ptr<void, std::function<void(void*)>>;

/**
 * @brief Owns a dlopen() handle for a vendor runtime library.
 *
 * The vendor encode API ships with the driver rather than the toolkit, so it is resolved at run time.
 * A missing library is reported as an hwenc_error: the encoder is simply unavailable on this host.
 */
class dynamic_lib {
public:
    dynamic_lib(dynamic_lib&& other) noexcept
        : handle_{std::move(other.handle_)}
        , library_path_{std::move(other.library_path_)} { }

    dynamic_lib& operator=(dynamic_lib&& other) noexcept {
        if (this != &other) {
            handle_       = std::move(other.handle_);
            library_path_ = std::move(other.library_path_);
        }
        return *this;
    }

    ~dynamic_lib() {
#ifndef NDEBUG
        if (!library_path_.empty()) {
            if (auto log = spdlog::get("hwenc")) {
                log->debug("[dynamic_lib] Releasing library : {}", library_path_);
            }
        }
#endif /// NDEBUG
    }

    static dynamic_lib create(const std::string& path) {
        RAC_ERRNO_MSG("dynamic_lib before dlopen");
        void* handle = dlopen(path.c_str(), RTLD_LAZY | RTLD_LOCAL);
        RAC_ERRNO_MSG("dynamic_lib after dlopen");

        if (!handle) {
            const char* error = dlerror();
            throw hwenc_error{"dlopen(\"" + path + "\"): " + (error == nullptr ? "NULL" : std::string{error})};
        }

        return dynamic_lib{void_ptr{handle,
                                    [](void* handle) {
                                        RAC_ERRNO();
                                        if (dlclose(handle) != 0) {
                                            const char* error = dlerror();
                                            if (auto log = spdlog::get("hwenc")) {
                                                log->warn("[dynamic_lib] dlclose(): {}", error == nullptr ? "NULL" : error);
                                            }
                                        }
                                    }},
                           path};
    }

    /**
     * @brief Opens the first library of @p candidates that loads.
     *
     * @throws hwenc_error naming every candidate when none of them loads.
     */
    static dynamic_lib create_any(std::initializer_list<std::string> candidates) {
        std::string errors;
        for (const auto& candidate : candidates) {
            try {
                return create(candidate);
            } catch (const hwenc_error& e) {
                errors += std::string{errors.empty() ? "" : "; "} + e.what();
            }
        }
        throw hwenc_error{"no loadable library: " + errors};
    }

    /**
     * @brief Resolves @p symbol_name as a value of type T (usually a function pointer).
     */
    template<typename T>
    T get(const std::string& symbol_name) const {
        RAC_ERRNO_MSG("dynamic_lib before dlsym");
        dlerror();
        void* symbol = dlsym(handle_.get(), symbol_name.c_str());
        if (const char* error = dlerror()) {
            throw hwenc_error{"dlsym(\"" + symbol_name + "\") in " + library_path_ + ": " + std::string{error}};
        }
        return reinterpret_cast<T>(symbol);
    }

    [[nodiscard]] const std::string& path() const {
        return library_path_;
    }

private:
    explicit dynamic_lib(void_ptr&& handle, std::string lib_path)
        : handle_{std::move(handle)}
        , library_path_{std::move(lib_path)} { }

    void_ptr    handle_;
    std::string library_path_;
};

} // namespace HWENC
