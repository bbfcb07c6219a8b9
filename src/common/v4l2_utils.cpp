#include "common/v4l2_utils.h"

#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

#include "common/logging.h"

std::string V4l2Util::FourccToString(uint32_t fourcc) {
    int length = 4;
    std::string buf;
    buf.resize(length);

    for (int i = 0; i < length; i++) {
        const int c = fourcc & 0xff;
        buf[i] = c;
        fourcc >>= 8;
    }
    return buf;
}

uint32_t V4l2Util::FormatFromString(const std::string &name) {
    if (name == "mjpeg") {
        return V4L2_PIX_FMT_MJPEG;
    } else if (name == "yuyv") {
        return V4L2_PIX_FMT_YUYV;
    } else if (name == "i420") {
        return V4L2_PIX_FMT_YUV420;
    }
    return 0;
}

int V4l2Util::OpenDevice(const char *file) {
    int fd = open(file, O_RDWR | O_NONBLOCK);
    if (fd < 0) {
        ERROR_PRINT("v4l2 open(%s): %s", file, strerror(errno));
        return -1;
    }
    DEBUG_PRINT("Open file %s fd(%d) success!", file, fd);
    return fd;
}

void V4l2Util::CloseDevice(int fd) {
    if (fd < 0) {
        return;
    }
    close(fd);
    DEBUG_PRINT("fd(%d) is closed!", fd);
}

bool V4l2Util::QueryCapabilities(int fd, v4l2_capability *cap) {
    if (ioctl(fd, VIDIOC_QUERYCAP, cap) < 0) {
        ERROR_PRINT("fd(%d) query capabilities: %s", fd, strerror(errno));
        return false;
    }
    return true;
}

bool V4l2Util::InitBuffer(int fd, V4l2BufferGroup *gbuffer, v4l2_buf_type type,
                          v4l2_memory memory) {
    v4l2_capability cap = {};
    if (!V4l2Util::QueryCapabilities(fd, &cap)) {
        return false;
    }

    if (!(cap.capabilities & V4L2_CAP_VIDEO_CAPTURE) || !(cap.capabilities & V4L2_CAP_STREAMING)) {
        ERROR_PRINT("fd(%d) driver '%s' is not a streaming capture device", fd, cap.driver);
        return false;
    }

    DEBUG_PRINT("fd(%d) driver '%s' on card '%s'", fd, cap.driver, cap.card);
    gbuffer->fd = fd;
    gbuffer->type = type;
    gbuffer->memory = memory;

    return true;
}

bool V4l2Util::DequeueBuffer(int fd, v4l2_buffer *buffer) {
    if (ioctl(fd, VIDIOC_DQBUF, buffer) < 0) {
        if (errno != EAGAIN) {
            ERROR_PRINT("fd(%d) dequeue buffer: %s", fd, strerror(errno));
        }
        return false;
    }
    return true;
}

bool V4l2Util::QueueBuffer(int fd, v4l2_buffer *buffer) {
    if (ioctl(fd, VIDIOC_QBUF, buffer) < 0) {
        ERROR_PRINT("fd(%d) queue buffer(%u): %s", fd, buffer->index, strerror(errno));
        return false;
    }
    return true;
}

bool V4l2Util::QueueBuffers(int fd, V4l2BufferGroup *gbuffer) {
    for (int i = 0; i < gbuffer->num_buffers; i++) {
        v4l2_buffer *inner = &gbuffer->buffers[i].inner;
        if (!V4l2Util::QueueBuffer(fd, inner)) {
            return false;
        }
    }
    return true;
}

std::unordered_set<std::string> V4l2Util::GetDeviceSupportedFormats(const char *file) {
    std::unordered_set<std::string> formats;
    int fd = V4l2Util::OpenDevice(file);
    if (fd < 0) {
        return formats;
    }

    v4l2_fmtdesc fmtdesc = {};
    fmtdesc.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    while (ioctl(fd, VIDIOC_ENUM_FMT, &fmtdesc) == 0) {
        formats.insert(V4l2Util::FourccToString(fmtdesc.pixelformat));
        fmtdesc.index++;
    }
    V4l2Util::CloseDevice(fd);

    return formats;
}

bool V4l2Util::SetFps(int fd, v4l2_buf_type type, int fps) {
    struct v4l2_streamparm streamparms = {};
    streamparms.type = type;
    streamparms.parm.capture.timeperframe.numerator = 1;
    streamparms.parm.capture.timeperframe.denominator = fps;
    if (ioctl(fd, VIDIOC_S_PARM, &streamparms) < 0) {
        ERROR_PRINT("fd(%d) set fps(%d): %s", fd, fps, strerror(errno));
        return false;
    }
    return true;
}

bool V4l2Util::SetFormat(int fd, V4l2BufferGroup *gbuffer, int &width, int &height,
                         uint32_t pixel_format) {
    v4l2_format fmt = {};
    fmt.type = gbuffer->type;
    if (ioctl(fd, VIDIOC_G_FMT, &fmt) < 0) {
        ERROR_PRINT("fd(%d) get format: %s", fd, strerror(errno));
        return false;
    }

    DEBUG_PRINT("fd(%d) original format: %s(%dx%d)", fd,
                V4l2Util::FourccToString(fmt.fmt.pix.pixelformat).c_str(), fmt.fmt.pix.width,
                fmt.fmt.pix.height);

    fmt.fmt.pix.width = width;
    fmt.fmt.pix.height = height;
    fmt.fmt.pix.pixelformat = pixel_format;
    fmt.fmt.pix.field = V4L2_FIELD_NONE;

    if (ioctl(fd, VIDIOC_S_FMT, &fmt) < 0) {
        ERROR_PRINT("fd(%d) set format(%s): %s", fd,
                    V4l2Util::FourccToString(pixel_format).c_str(), strerror(errno));
        return false;
    }

    if (fmt.fmt.pix.pixelformat != pixel_format) {
        ERROR_PRINT("fd(%d) driver refused format %s, got %s", fd,
                    V4l2Util::FourccToString(pixel_format).c_str(),
                    V4l2Util::FourccToString(fmt.fmt.pix.pixelformat).c_str());
        return false;
    }

    width = fmt.fmt.pix.width;
    height = fmt.fmt.pix.height;
    DEBUG_PRINT("fd(%d) latest format: %s(%dx%d)", fd,
                V4l2Util::FourccToString(fmt.fmt.pix.pixelformat).c_str(), width, height);

    return true;
}

bool V4l2Util::SetCtrl(int fd, uint32_t id, int32_t value) {
    v4l2_control ctrls = {};
    ctrls.id = id;
    ctrls.value = value;
    if (ioctl(fd, VIDIOC_S_CTRL, &ctrls) < 0) {
        ERROR_PRINT("fd(%d) set ctrl(%d): %s", fd, id, strerror(errno));
        return false;
    }
    return true;
}

bool V4l2Util::SetExposure(int fd, int exposure_us) {
    if (exposure_us <= 0) {
        return SetCtrl(fd, V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_AUTO) ||
               SetCtrl(fd, V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_APERTURE_PRIORITY);
    }

    if (!SetCtrl(fd, V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_MANUAL)) {
        return false;
    }
    // V4L2_CID_EXPOSURE_ABSOLUTE is expressed in 100 us units.
    return SetCtrl(fd, V4L2_CID_EXPOSURE_ABSOLUTE, std::max(1, exposure_us / 100));
}

bool V4l2Util::StreamOn(int fd, v4l2_buf_type type) {
    if (ioctl(fd, VIDIOC_STREAMON, &type) < 0) {
        ERROR_PRINT("fd(%d) turn on stream: %s", fd, strerror(errno));
        return false;
    }
    return true;
}

bool V4l2Util::StreamOff(int fd, v4l2_buf_type type) {
    if (ioctl(fd, VIDIOC_STREAMOFF, &type) < 0) {
        ERROR_PRINT("fd(%d) turn off stream: %s", fd, strerror(errno));
        return false;
    }
    return true;
}

void V4l2Util::UnMap(V4l2BufferGroup *gbuffer) {
    for (int i = 0; i < gbuffer->num_buffers; i++) {
        if (gbuffer->buffers[i].start != nullptr) {
            munmap(gbuffer->buffers[i].start, gbuffer->buffers[i].length);
            gbuffer->buffers[i].start = nullptr;
        }
    }
    DEBUG_PRINT("fd(%d) unmapped %d buffers", gbuffer->fd, gbuffer->num_buffers);
}

bool V4l2Util::MMap(int fd, V4l2BufferGroup *gbuffer) {
    for (int i = 0; i < gbuffer->num_buffers; i++) {
        V4l2Buffer *buffer = &gbuffer->buffers[i];
        v4l2_buffer *inner = &buffer->inner;
        inner->type = gbuffer->type;
        inner->memory = V4L2_MEMORY_MMAP;
        inner->index = i;

        if (ioctl(fd, VIDIOC_QUERYBUF, inner) < 0) {
            ERROR_PRINT("fd(%d) query buffer: %s", fd, strerror(errno));
            return false;
        }

        buffer->length = inner->length;
        buffer->start =
            mmap(NULL, buffer->length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, inner->m.offset);

        if (MAP_FAILED == buffer->start) {
            ERROR_PRINT("fd(%d) mmap buffer(%d): %s", fd, i, strerror(errno));
            buffer->start = nullptr;
            return false;
        }

        DEBUG_PRINT("fd(%d) query buffer at %p (length: %d)", fd, buffer->start, buffer->length);
    }

    return true;
}

bool V4l2Util::AllocateBuffer(int fd, V4l2BufferGroup *gbuffer, int num_buffers) {
    v4l2_requestbuffers req = {};
    req.count = num_buffers;
    req.memory = gbuffer->memory;
    req.type = gbuffer->type;

    if (ioctl(fd, VIDIOC_REQBUFS, &req) < 0) {
        ERROR_PRINT("fd(%d) request buffer: %s", fd, strerror(errno));
        return false;
    }

    if (req.count < 2) {
        ERROR_PRINT("fd(%d) insufficient buffer memory, got %u buffers", fd, req.count);
        return false;
    }

    gbuffer->num_buffers = req.count;
    gbuffer->buffers.resize(req.count);

    return MMap(fd, gbuffer);
}

bool V4l2Util::DeallocateBuffer(int fd, V4l2BufferGroup *gbuffer) {
    V4l2Util::UnMap(gbuffer);

    v4l2_requestbuffers req = {};
    req.count = 0;
    req.memory = gbuffer->memory;
    req.type = gbuffer->type;

    if (ioctl(fd, VIDIOC_REQBUFS, &req) < 0) {
        ERROR_PRINT("fd(%d) release buffer: %s", fd, strerror(errno));
        return false;
    }

    gbuffer->num_buffers = 0;
    gbuffer->buffers.clear();

    return true;
}
