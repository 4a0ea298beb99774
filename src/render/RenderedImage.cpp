#include "render/RenderedImage.h"

#include <SDL_image.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

std::vector<unsigned char>* Sink(SDL_RWops* ctx) {
    return static_cast<std::vector<unsigned char>*>(ctx->hidden.unknown.data1);
}

Sint64 SDLCALL SinkSize(SDL_RWops* ctx) {
    return static_cast<Sint64>(Sink(ctx)->size());
}

// Append-only stream: only position queries are supported.
Sint64 SDLCALL SinkSeek(SDL_RWops* ctx, Sint64 offset, int whence) {
    if (offset == 0 && (whence == RW_SEEK_CUR || whence == RW_SEEK_END)) {
        return static_cast<Sint64>(Sink(ctx)->size());
    }
    return SDL_SetError("seek not supported on JPEG sink");
}

size_t SDLCALL SinkRead(SDL_RWops*, void*, size_t, size_t) {
    SDL_SetError("read not supported on JPEG sink");
    return 0;
}

size_t SDLCALL SinkWrite(SDL_RWops* ctx, const void* ptr, size_t size, size_t num) {
    const unsigned char* data = static_cast<const unsigned char*>(ptr);
    Sink(ctx)->insert(Sink(ctx)->end(), data, data + size * num);
    return num;
}

int SDLCALL SinkClose(SDL_RWops* ctx) {
    SDL_FreeRW(ctx);
    return 0;
}

SDL_RWops* OpenSink(std::vector<unsigned char>* buffer) {
    SDL_RWops* ctx = SDL_AllocRW();
    if (!ctx) {
        return nullptr;
    }
    ctx->size = SinkSize;
    ctx->seek = SinkSeek;
    ctx->read = SinkRead;
    ctx->write = SinkWrite;
    ctx->close = SinkClose;
    ctx->type = SDL_RWOPS_UNKNOWN;
    ctx->hidden.unknown.data1 = buffer;
    return ctx;
}

} // namespace

bool EncodeJpeg(SDL_Surface* canvas, int quality, std::vector<unsigned char>* out, Error* error) {
    out->clear();
    if (!canvas) {
        return SetError(error, ErrorCode::EncodingFailure, "no canvas to encode");
    }
    SDL_RWops* sink = OpenSink(out);
    if (!sink) {
        return SetError(error, ErrorCode::EncodingFailure, std::string("SDL_AllocRW failed: ") + SDL_GetError());
    }
    int rc = IMG_SaveJPG_RW(canvas, sink, 0, quality);
    SDL_RWclose(sink);
    if (rc != 0 || out->empty()) {
        out->clear();
        return SetError(error, ErrorCode::EncodingFailure, std::string("IMG_SaveJPG_RW failed: ") + IMG_GetError());
    }
    return true;
}

bool RenderedImage::WriteToFile(const std::string& path, Error* error) const {
    if (bytes.empty()) {
        return SetError(error, ErrorCode::EncodingFailure, "nothing to write to " + path);
    }
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return SetError(error, ErrorCode::EncodingFailure,
                            "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return SetError(error, ErrorCode::EncodingFailure, "cannot open " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return SetError(error, ErrorCode::EncodingFailure, "short write to " + path);
    }
    std::cout << "Card: wrote " << bytes.size() << " bytes to " << path << "\n";
    return true;
}
