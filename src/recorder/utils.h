#ifndef RECORDER_UTILS_H_
#define RECORDER_UTILS_H_

#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

class RecUtil {
  public:
    static AVFormatContext *CreateContainer(const std::string &folder, const std::string &filename);
    static bool WriteFormatHeader(AVFormatContext *fmt_ctx);
    static void CloseContext(AVFormatContext *fmt_ctx);
    // Releases a container whose header was never written.
    static void FreeContext(AVFormatContext *fmt_ctx);

    // Opens the first encoder in `candidates` that accepts a yuv420p stream of
    // the given size and rate. Returns nullptr if none does.
    static AVCodecContext *OpenVideoEncoder(const std::vector<std::string> &candidates, int width,
                                            int height, int fps, bool global_header);
    static std::string ErrorString(int errnum);
};

#endif // RECORDER_UTILS_H_
