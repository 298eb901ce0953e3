#pragma once

#include "config.h"
#include "export.h"
#include "types.h"
#include <functional>
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Exit status and combined stdout/stderr of an external command
 */
struct CommandOutput {
    int exit_code = 0;
    std::string output;
};

/**
 * @brief Runs an argv-style command and waits for it
 */
using CommandRunner = std::function<CommandOutput(const std::vector<std::string>& args)>;

/**
 * @brief Video compositor collaborator
 *
 * Consumes either a subtitle file or positioned raster overlays and
 * produces the re-encoded video. Failures are reported as ServiceError.
 */
class TIRGUM_API VideoCompositor {
public:
    virtual ~VideoCompositor() = default;

    /**
     * @brief Burn a subtitle file into the video
     */
    virtual void burn_subtitles(const std::string& video_path,
                                const std::string& subtitle_path,
                                const std::string& output_path) = 0;

    /**
     * @brief Composite pre-rendered overlays, each visible during its own time window
     */
    virtual void composite_overlays(const std::string& video_path,
                                    const std::vector<RasterOverlay>& overlays,
                                    const std::string& output_path) = 0;

    /**
     * @brief Where intermediate files go and whether they outlive the call
     *
     * @param work_dir Directory for intermediate files (empty = system temp dir)
     *
     * Compositors that write no intermediate files ignore this.
     */
    virtual void set_temp_files(const std::string& /*work_dir*/, bool /*keep_temp_files*/) {}
};

/**
 * @brief VideoCompositor driving the ffmpeg command line tool
 *
 * Video is re-encoded with H.264 (ultrafast preset, CRF 23 by default),
 * audio is stream-copied and the output is capped at
 * CompositorOptions::duration_limit seconds.
 *
 * Overlays are written as PAM images (RGBA) into a per-call temporary
 * directory and chained through ffmpeg's overlay filter with
 * enable='between(t,start,end)'.
 *
 * Usage:
 * @code
 *   tirgum::FfmpegCompositor compositor(config.compositor);
 *   compositor.burn_subtitles("in.mp4", "he.srt", "out.mp4");
 * @endcode
 */
class TIRGUM_API FfmpegCompositor : public VideoCompositor {
public:
    explicit FfmpegCompositor(const CompositorOptions& options,
                              CommandRunner runner = &FfmpegCompositor::run_command);

    /**
     * @throws ServiceError if ffmpeg exits with a non-zero status
     */
    void burn_subtitles(const std::string& video_path,
                        const std::string& subtitle_path,
                        const std::string& output_path) override;

    /**
     * @throws ServiceError if ffmpeg exits with a non-zero status
     * @throws Error if an overlay image cannot be written
     */
    void composite_overlays(const std::string& video_path,
                            const std::vector<RasterOverlay>& overlays,
                            const std::string& output_path) override;

    /**
     * @brief Overlay images go to a fresh directory under work_dir
     */
    void set_temp_files(const std::string& work_dir, bool keep_temp_files) override {
        work_dir_ = work_dir;
        keep_temp_files_ = keep_temp_files;
    }

    const std::string& work_dir() const { return work_dir_; }
    bool keep_temp_files() const { return keep_temp_files_; }

    std::vector<std::string> burn_command(const std::string& video_path,
                                          const std::string& subtitle_path,
                                          const std::string& output_path) const;

    /**
     * @param image_paths One PAM image per overlay, same order
     */
    std::vector<std::string> overlay_command(const std::string& video_path,
                                             const std::vector<std::string>& image_paths,
                                             const std::vector<RasterOverlay>& overlays,
                                             const std::string& output_path) const;

    /**
     * @brief force_style argument of the subtitles filter
     *
     * e.g. "Fontname=Noto Sans Hebrew,FontSize=28,Alignment=2,Outline=2,Shadow=1,MarginV=40"
     */
    static std::string force_style(const CompositorOptions& options);

    /**
     * @brief Quote a value for use inside a filtergraph argument
     */
    static std::string quote_filter_value(const std::string& value);

    /**
     * @brief Write an overlay as a PAM (P7, RGB_ALPHA) image
     *
     * @throws Error if the file cannot be written
     */
    static void write_pam(const RasterOverlay& overlay, const std::string& path);

    /**
     * @brief Default runner: executes through the shell, capturing stdout and stderr
     */
    static CommandOutput run_command(const std::vector<std::string>& args);

    static std::string shell_quote(const std::string& arg);

    const CompositorOptions& options() const { return options_; }

private:
    void append_encoder_args(std::vector<std::string>& args) const;
    void run(const std::vector<std::string>& args) const;

    CompositorOptions options_;
    CommandRunner runner_;
    std::string work_dir_;
    bool keep_temp_files_ = false;
};

} // namespace tirgum
