#ifndef AUTOSTART_HPP
#define AUTOSTART_HPP
#include <functional>
#include <optional>
#include <string>
#include "autostart_descriptor.hpp"
#include "command_runner.hpp"
#include "platform_probe.hpp"

namespace autostart {

enum class AutostartErrc {
    None,
    Unsupported,    ///< no registration mechanism on this host
    BinaryNotFound, ///< the daemon executable could not be located
    Io,             ///< creating, writing or removing the descriptor failed
};

struct AutostartError {
    AutostartErrc code = AutostartErrc::None;
    std::string message;
};

/**
 * @brief Registers the daemon for automatic start with the host service
 * manager.
 *
 * The descriptor file on disk is the only state: the daemon is enabled exactly
 * when the file exists. Every call recomputes the platform and the target, so
 * an instance may be kept around or recreated freely.
 *
 * Operations return `false` on failure and leave the reason in last_error().
 * No locking is done; concurrent toggles from different processes may observe
 * a stale state.
 */
class AutostartRegistrar {
  public:
    using PlatformDetector = std::function<AutostartPlatform()>;
    using BinaryResolver = std::function<std::optional<std::filesystem::path>()>;

    /**
     * @param runner   Runs `systemctl`, `which` and other external tools.
     * @param detector Platform override; when empty detect_platform() is used.
     * @param resolver Binary path override; when empty locate_daemon_binary()
     *                 is used with @p runner.
     */
    explicit AutostartRegistrar(procutil::CommandRunner runner = procutil::system_runner(),
                                PlatformDetector detector = {}, BinaryResolver resolver = {});

    /** @return `true` if the descriptor file exists; `false` when unsupported. */
    bool is_enabled() const;

    /**
     * @brief Write the descriptor, replacing any existing one.
     *
     * Parent directories are created as needed. On systemd the user manager
     * is asked to reload afterwards; failure of that reload is ignored.
     */
    bool enable();

    /**
     * @brief Remove the descriptor. A missing descriptor is not an error.
     */
    bool disable();

    /**
     * @brief Flip the current state.
     *
     * @return The new state, or `std::nullopt` when the underlying enable or
     *         disable failed.
     */
    std::optional<bool> toggle();

    /**
     * @brief Platform and descriptor path for this host.
     *
     * The content is left empty; it is rendered by enable() once the binary
     * has been located.
     *
     * @return The target, or `std::nullopt` when unsupported.
     */
    std::optional<AutostartTarget> target() const;

    AutostartPlatform platform() const;

    const AutostartError& last_error() const { return error_; }

  private:
    void reload_service_manager(AutostartPlatform platform) const;
    bool fail(AutostartErrc code, const std::string& message);

    procutil::CommandRunner runner_;
    PlatformDetector detector_;
    BinaryResolver resolver_;
    AutostartError error_;
};

} // namespace autostart

#endif // AUTOSTART_HPP
