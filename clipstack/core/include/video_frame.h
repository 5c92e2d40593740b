/*
 * File:        video_frame.h
 * Module:      clipstack-core
 * Purpose:     Planar video frame with properties
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "pixel_format.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace clipstack {

/// Frame property value types (mirrors what hosts attach to frames)
using FramePropertyValue = std::variant<
    int64_t,
    double,
    std::string
>;

using FrameProperties = std::map<std::string, FramePropertyValue>;

/// Name of the property carrying the encoder picture type
inline constexpr const char* PICTURE_TYPE_PROPERTY = "_PictType";

/**
 * @brief One frame: up to three planes of samples plus a property map
 *
 * Planes are stored with a stride aligned to 32 bytes. Once a frame has
 * been handed to a consumer as shared_ptr<const VideoFrame> it is
 * never modified again.
 */
class VideoFrame {
public:
    /**
     * @brief Allocate a zero-filled frame
     *
     * @param format Pixel format (must be defined)
     * @param width Luma width in samples
     * @param height Luma height in lines
     */
    VideoFrame(const PixelFormat& format, uint32_t width, uint32_t height);

    static std::shared_ptr<VideoFrame> create(const PixelFormat& format, uint32_t width, uint32_t height) {
        return std::make_shared<VideoFrame>(format, width, height);
    }

    const PixelFormat& format() const { return format_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    uint32_t plane_count() const { return format_.plane_count(); }

    uint32_t plane_width(uint32_t plane) const;
    uint32_t plane_height(uint32_t plane) const;

    /// Stride of a plane in bytes
    size_t stride(uint32_t plane) const { return strides_.at(plane); }

    const uint8_t* read_ptr(uint32_t plane) const { return planes_.at(plane).data(); }
    uint8_t* write_ptr(uint32_t plane) { return planes_.at(plane).data(); }

    /// Typed pointer to the start of a row
    template <typename T>
    const T* row(uint32_t plane, uint32_t y) const {
        return reinterpret_cast<const T*>(read_ptr(plane) + stride(plane) * y);
    }

    template <typename T>
    T* row_mut(uint32_t plane, uint32_t y) {
        return reinterpret_cast<T*>(write_ptr(plane) + stride(plane) * y);
    }

    // Properties
    const FrameProperties& properties() const { return properties_; }
    FrameProperties& properties() { return properties_; }
    void set_property(const std::string& key, FramePropertyValue value) {
        properties_[key] = std::move(value);
    }
    std::optional<FramePropertyValue> get_property(const std::string& key) const;

private:
    PixelFormat format_;
    uint32_t width_;
    uint32_t height_;
    std::vector<size_t> strides_;
    std::vector<std::vector<uint8_t>> planes_;
    FrameProperties properties_;
};

using VideoFramePtr = std::shared_ptr<const VideoFrame>;

} // namespace clipstack
