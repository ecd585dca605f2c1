#include "core/alpha_trim.h"
#include "core/aspect_resize.h"
#include "core/compositing.h"
#include "core/drop_shadow.h"
#include "core/icon_atlas.h"
#include "core/icon_pipeline.h"
#include "core/image_io.h"
#include "core/picture_pipeline.h"
#include "core/sprite_sheet.h"

#include "core/archive_input.h"

#include "test_support.h"

#include <fstream>
#include <iterator>
#include <climits>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

using namespace gearpix::core;

constexpr Color k_red{.r = 200, .g = 10, .b = 10, .a = 255};
constexpr Color k_green{.r = 10, .g = 200, .b = 10, .a = 255};
constexpr Color k_blue{.r = 10, .g = 10, .b = 200, .a = 255};

static PixelBuffer solid(int w, int h, const Color& color) {
    PixelBuffer buffer(w, h);
    buffer.fill(color);
    return buffer;
}

// A w x h block of color inside a transparent canvas, with a border of margin.
static PixelBuffer framed(int w, int h, int margin, const Color& color) {
    PixelBuffer buffer(w + (2 * margin), h + (2 * margin));
    buffer.blit(solid(w, h, color), margin, margin);
    return buffer;
}

static void test_pixel_buffer_bounds() {
    PixelBuffer buffer(4, 3);
    buffer.set(3, 2, k_red);
    EXPECT_EQ(buffer.at(3, 2), k_red);
    EXPECT_TRUE(buffer.at(0, 0).is_transparent());

    bool threw = false;
    try {
        (void)buffer.at(4, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    EXPECT_TRUE(threw);

    threw = false;
    try {
        PixelBuffer bad(2, 2, std::vector<unsigned char>(3));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    EXPECT_TRUE(threw);
}

static void test_trim() {
    PixelBuffer buffer = framed(5, 3, 4, k_red);
    buffer.set(0, 10, Color{.r = 1, .g = 2, .b = 3, .a = 1});

    PipelineError error;
    EXPECT_TRUE(trim_transparent(buffer, error));
    EXPECT_EQ(buffer.width(), 9);
    EXPECT_EQ(buffer.height(), 7);
    EXPECT_EQ(buffer.at(0, 6).a, 1);
    EXPECT_EQ(buffer.at(4, 0), k_red);

    // Trimming a trimmed buffer changes nothing.
    const PixelBuffer once = buffer;
    EXPECT_TRUE(trim_transparent(buffer, error));
    EXPECT_EQ(buffer, once);
}

static void test_trim_rejects_transparent() {
    PixelBuffer buffer(8, 8);
    PipelineError error;
    EXPECT_FALSE(trim_transparent(buffer, error));
    EXPECT_EQ(error.code, ErrorCode::EmptyImage);
    EXPECT_EQ(buffer.width(), 8);

    PixelBuffer empty;
    PipelineError empty_error;
    EXPECT_FALSE(trim_transparent(empty, empty_error));
    EXPECT_EQ(empty_error.code, ErrorCode::EmptyImage);
}

static void test_resize_with_aspect() {
    PipelineError error;
    PixelBuffer out;

    ResizeSpec spec;
    spec.target_size = 64;
    EXPECT_TRUE(resize_with_aspect(solid(20, 10, k_red), spec, out, error));
    EXPECT_EQ(out.width(), 64);
    EXPECT_EQ(out.height(), 32);
    EXPECT_EQ(out.at(31, 16), k_red);

    // Square sources resolve through the width branch.
    EXPECT_TRUE(resize_with_aspect(solid(10, 10, k_red), spec, out, error));
    EXPECT_EQ(out.width(), 64);
    EXPECT_EQ(out.height(), 64);

    spec.scale = 0.5;
    EXPECT_TRUE(resize_with_aspect(solid(10, 20, k_blue), spec, out, error));
    EXPECT_EQ(out.width(), 16);
    EXPECT_EQ(out.height(), 32);

    // 7 x 3 at 10: height 4.2857 rounds to 4.
    spec.scale = 1.0;
    spec.target_size = 10;
    EXPECT_TRUE(resize_with_aspect(solid(7, 3, k_green), spec, out, error));
    EXPECT_EQ(out.width(), 10);
    EXPECT_EQ(out.height(), 4);
    EXPECT_EQ(out.at(0, 0), k_green);
}

static void test_resize_with_anchor() {
    ResizeSpec spec;
    spec.target_size = 16;
    spec.anchor = ANCHOR_CENTER;

    PixelBuffer out;
    PipelineError error;
    EXPECT_TRUE(resize_with_aspect(solid(8, 4, k_red), spec, out, error));
    EXPECT_EQ(out.width(), 16);
    EXPECT_EQ(out.height(), 16);
    EXPECT_TRUE(out.at(8, 3).is_transparent());
    EXPECT_EQ(out.at(8, 4), k_red);
    EXPECT_EQ(out.at(8, 11), k_red);
    EXPECT_TRUE(out.at(8, 12).is_transparent());
}

static void test_resize_rejects_bad_targets() {
    PixelBuffer out;
    ResizeSpec spec;

    PipelineError zero_target;
    spec.target_size = 0;
    EXPECT_FALSE(resize_with_aspect(solid(4, 4, k_red), spec, out, zero_target));
    EXPECT_EQ(zero_target.code, ErrorCode::InvalidDimension);

    // 30 x 1 to 1 wide would be 0 pixels tall.
    PipelineError collapsed;
    spec.target_size = 1;
    EXPECT_FALSE(resize_with_aspect(solid(30, 1, k_red), spec, out, collapsed));
    EXPECT_EQ(collapsed.code, ErrorCode::InvalidDimension);

    PipelineError negative_scale;
    spec.target_size = 8;
    spec.scale = -1.0;
    EXPECT_FALSE(resize_with_aspect(solid(4, 4, k_red), spec, out, negative_scale));
    EXPECT_EQ(negative_scale.code, ErrorCode::InvalidDimension);

    PipelineError bad_size;
    EXPECT_FALSE(resample_bicubic(solid(4, 4, k_red), 0, 4, out, bad_size));
    EXPECT_EQ(bad_size.code, ErrorCode::InvalidDimension);
}

static void test_resize_rejects_oversized_results() {
    PixelBuffer out;
    ResizeSpec spec;
    spec.target_size = 64;
    spec.scale = 1e8;

    PipelineError huge_scale;
    EXPECT_FALSE(resize_with_aspect(solid(4, 4, k_red), spec, out, huge_scale));
    EXPECT_EQ(huge_scale.code, ErrorCode::InvalidDimension);

    // The long side fits but the padded canvas would not.
    PipelineError huge_canvas;
    spec.scale = 1.0;
    spec.target_size = MAX_IMAGE_DIMENSION + 1.0;
    spec.anchor = ANCHOR_CENTER;
    EXPECT_FALSE(resize_with_aspect(solid(4, 4, k_red), spec, out, huge_canvas));
    EXPECT_EQ(huge_canvas.code, ErrorCode::InvalidDimension);

    PipelineError huge_target;
    EXPECT_FALSE(resample_bicubic(solid(4, 4, k_red), MAX_IMAGE_DIMENSION + 1, 4, out, huge_target));
    EXPECT_EQ(huge_target.code, ErrorCode::InvalidDimension);

    std::vector<PixelBuffer> frames;
    frames.push_back(solid(8, 8, k_red));
    PictureResult result;
    std::ostringstream log;
    PipelineError picture;
    EXPECT_FALSE(process_picture(std::move(frames), std::nullopt, 1e8, Anchor{}, result, log, picture));
    EXPECT_EQ(picture.code, ErrorCode::InvalidDimension);
}

static void test_resample_interpolates() {
    PixelBuffer ramp(2, 1);
    ramp.set(0, 0, Color{.r = 0, .g = 0, .b = 0, .a = 255});
    ramp.set(1, 0, Color{.r = 255, .g = 255, .b = 255, .a = 255});

    PixelBuffer wide;
    PipelineError error;
    ASSERT_TRUE(resample_bicubic(ramp, 16, 1, wide, error));
    EXPECT_TRUE(wide.at(0, 0).r < wide.at(15, 0).r);
    EXPECT_TRUE(wide.at(7, 0).r > 20 && wide.at(7, 0).r < 235);
    EXPECT_TRUE(wide.at(8, 0).r > 20 && wide.at(8, 0).r < 235);

    PixelBuffer checker(8, 8);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            const unsigned char v = ((x + y) % 2 == 0) ? 0 : 255;
            checker.set(x, y, Color{.r = v, .g = v, .b = v, .a = 255});
        }
    }
    PixelBuffer small;
    ASSERT_TRUE(resample_bicubic(checker, 4, 4, small, error));
    for (int y = 1; y <= 2; ++y) {
        for (int x = 1; x <= 2; ++x) {
            const int v = small.at(x, y).r;
            EXPECT_TRUE(v > 60 && v < 195);
            EXPECT_EQ(small.at(x, y).a, 255);
        }
    }
}

static void test_resize_preserves_aspect() {
    const std::vector<int> sides = {1, 2, 3, 5, 7, 11, 16, 23, 40, 64, 97};
    const std::vector<double> targets = {8.0, 17.0, 64.0, 100.0};
    for (int w : sides) {
        for (int h : sides) {
            const PixelBuffer source = solid(w, h, k_green);
            for (double target : targets) {
                ResizeSpec spec;
                spec.target_size = target;

                const bool width_leads = w >= h;
                const long long_side = std::lround(target);
                const long short_side = width_leads ? std::lround(h * (target / w)) : std::lround(w * (target / h));

                PixelBuffer out;
                PipelineError error;
                const bool ok = resize_with_aspect(source, spec, out, error);
                if (short_side <= 0) {
                    EXPECT_FALSE(ok);
                    EXPECT_EQ(error.code, ErrorCode::InvalidDimension);
                    continue;
                }
                EXPECT_TRUE(ok);
                if (!ok) {
                    continue;
                }
                EXPECT_EQ(static_cast<long>(width_leads ? out.width() : out.height()), long_side);
                if (w == h) {
                    EXPECT_EQ(out.width(), out.height());
                }
                // The short side is the exact proportional length, off by at most one pixel.
                if (width_leads) {
                    EXPECT_NEAR(static_cast<double>(out.height()), static_cast<double>(out.width()) * h / w, 1.0);
                } else {
                    EXPECT_NEAR(static_cast<double>(out.width()), static_cast<double>(out.height()) * w / h, 1.0);
                }
            }
        }
    }
}

static void test_sprite_sheet() {
    const std::vector<PixelBuffer> frames = {solid(10, 10, k_red), solid(10, 10, k_green), solid(10, 10, k_blue)};
    PixelBuffer sheet;
    PipelineError error;
    EXPECT_TRUE(compose_sprite_sheet(frames, sheet, error));
    EXPECT_EQ(sheet.width(), 30);
    EXPECT_EQ(sheet.height(), 10);
    for (int x = 0; x < 30; ++x) {
        EXPECT_EQ(sheet.at(x, 5), frames[static_cast<size_t>(x / 10)].at(x % 10, 5));
    }

    const std::vector<PixelBuffer> mismatched = {solid(10, 10, k_red), solid(10, 9, k_green)};
    PipelineError mismatch;
    EXPECT_FALSE(compose_sprite_sheet(mismatched, sheet, mismatch));
    EXPECT_EQ(mismatch.code, ErrorCode::DimensionMismatch);
    EXPECT_TRUE(mismatch.message.find("10x9") != std::string::npos);
}

static void test_blend_over() {
    const Color half_black{.r = 0, .g = 0, .b = 0, .a = 128};
    EXPECT_EQ(blend_over(k_red, Color{}), k_red);
    EXPECT_EQ(blend_over(Color{}, half_black), half_black);
    EXPECT_EQ(blend_over(k_red, k_blue), k_blue);

    const Color mixed = blend_over(Color{.r = 255, .g = 255, .b = 255, .a = 255}, half_black);
    EXPECT_EQ(mixed.a, 255);
    EXPECT_EQ(mixed.r, 127);
}

static void test_drop_shadow() {
    const Color shadow_color{.r = 0, .g = 0, .b = 0, .a = 116};
    PixelBuffer buffer(16, 16);
    buffer.blit(solid(10, 10, k_red), 0, 0);

    ShadowSpec shadow;
    shadow.offset_x = 2;
    shadow.offset_y = 2;
    shadow.blur_radius = 0;
    apply_drop_shadow(buffer, shadow);

    ASSERT_TRUE(buffer.width() == 16 && buffer.height() == 16);
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            const Color pixel = buffer.at(x, y);
            if (x < 10 && y < 10) {
                EXPECT_EQ(pixel, k_red);
            } else if (x >= 2 && x <= 11 && y >= 2 && y <= 11) {
                EXPECT_EQ(pixel, shadow_color);
            } else {
                EXPECT_TRUE(pixel.is_transparent());
            }
        }
    }
}

static void test_drop_shadow_clips_at_edges() {
    const Color shadow_color{.r = 0, .g = 0, .b = 0, .a = 116};
    ShadowSpec shadow;
    shadow.offset_x = 2;
    shadow.offset_y = 2;
    shadow.blur_radius = 0;

    // Only a one pixel strip of the shadow stays inside the canvas.
    PixelBuffer partial(11, 11);
    partial.blit(solid(10, 10, k_red), 0, 0);
    apply_drop_shadow(partial, shadow);
    ASSERT_TRUE(partial.width() == 11 && partial.height() == 11);
    for (int y = 0; y < 11; ++y) {
        for (int x = 0; x < 11; ++x) {
            const Color pixel = partial.at(x, y);
            if (x < 10 && y < 10) {
                EXPECT_EQ(pixel, k_red);
            } else if (x >= 2 && y >= 2) {
                EXPECT_EQ(pixel, shadow_color);
            } else {
                EXPECT_TRUE(pixel.is_transparent());
            }
        }
    }

    // The square touches the right and bottom edges: the whole shadow is lost.
    PixelBuffer flush(12, 12);
    flush.blit(solid(10, 10, k_red), 2, 2);
    const PixelBuffer before = flush;
    apply_drop_shadow(flush, shadow);
    EXPECT_EQ(flush, before);
}

static void test_drop_shadow_extreme_parameters() {
    PixelBuffer buffer = framed(4, 4, 2, k_red);
    const PixelBuffer before = buffer;

    ShadowSpec far_away;
    far_away.offset_x = INT_MAX;
    far_away.offset_y = INT_MIN;
    far_away.blur_radius = 0;
    apply_drop_shadow(buffer, far_away);
    EXPECT_EQ(buffer, before);

    PixelBuffer blurred(6, 6);
    blurred.set(3, 3, k_red);
    gaussian_blur(blurred, INT_MAX);
    EXPECT_EQ(blurred.width(), 6);

    PipelineError ok_error;
    EXPECT_TRUE(validate_shadow_spec(ShadowSpec{}, ok_error));

    ShadowSpec wide_blur;
    wide_blur.blur_radius = 1000000000;
    PipelineError blur_error;
    EXPECT_FALSE(validate_shadow_spec(wide_blur, blur_error));
    EXPECT_EQ(blur_error.code, ErrorCode::InvalidArgument);

    ShadowSpec negative_blur;
    negative_blur.blur_radius = -1;
    PipelineError negative_error;
    EXPECT_FALSE(validate_shadow_spec(negative_blur, negative_error));
    EXPECT_EQ(negative_error.code, ErrorCode::InvalidArgument);

    PixelBuffer atlas;
    std::ostringstream log;
    PipelineError atlas_blur;
    EXPECT_FALSE(compose_icon_atlas(solid(8, 8, k_red), wide_blur, atlas, log, atlas_blur));
    EXPECT_EQ(atlas_blur.code, ErrorCode::InvalidArgument);

    ShadowSpec wide_offset;
    wide_offset.offset_x = INT_MAX;
    PipelineError atlas_offset;
    EXPECT_FALSE(compose_icon_atlas(solid(8, 8, k_red), wide_offset, atlas, log, atlas_offset));
    EXPECT_EQ(atlas_offset.code, ErrorCode::InvalidArgument);

    ShadowSpec edge_offset;
    edge_offset.offset_y = -MAX_SHADOW_OFFSET;
    edge_offset.blur_radius = MAX_SHADOW_BLUR_RADIUS;
    PipelineError edge_error;
    EXPECT_TRUE(validate_shadow_spec(edge_offset, edge_error));
}

static void test_gaussian_blur_spreads_alpha() {
    PixelBuffer buffer(9, 9);
    buffer.set(4, 4, Color{.r = 0, .g = 0, .b = 0, .a = 255});
    gaussian_blur(buffer, 1);

    EXPECT_TRUE(buffer.at(4, 4).a < 255);
    EXPECT_TRUE(buffer.at(5, 4).a > 0);
    EXPECT_EQ(buffer.at(5, 4).a, buffer.at(3, 4).a);
    EXPECT_EQ(buffer.at(4, 5).a, buffer.at(4, 3).a);
    EXPECT_TRUE(buffer.at(0, 0).a < buffer.at(5, 5).a);

    PixelBuffer untouched = framed(3, 3, 2, k_red);
    const PixelBuffer before = untouched;
    gaussian_blur(untouched, 0);
    EXPECT_EQ(untouched, before);
}

static void test_icon_atlas() {
    ShadowSpec shadow;
    shadow.blur_radius = 0;
    shadow.color = Color{};

    PixelBuffer atlas;
    std::ostringstream log;
    PipelineError error;
    EXPECT_TRUE(compose_icon_atlas(framed(32, 32, 6, k_blue), shadow, atlas, log, error));
    EXPECT_EQ(atlas.width(), ICON_ATLAS_WIDTH);
    EXPECT_EQ(atlas.height(), ICON_ATLAS_HEIGHT);

    EXPECT_EQ(atlas.at(0, 0), k_blue);
    EXPECT_EQ(atlas.at(63, 63), k_blue);
    EXPECT_EQ(atlas.at(64, 0), k_blue);
    EXPECT_EQ(atlas.at(95, 31), k_blue);
    EXPECT_TRUE(atlas.at(80, 32).is_transparent());
    EXPECT_EQ(atlas.at(111, 15), k_blue);
    EXPECT_TRUE(atlas.at(100, 16).is_transparent());
    EXPECT_EQ(atlas.at(119, 7), k_blue);
    EXPECT_TRUE(atlas.at(116, 8).is_transparent());

    EXPECT_TRUE(log.str().find("Generated icon layer: 8x8 at position 112,0") != std::string::npos);
}

static void test_icon_atlas_padding() {
    PixelBuffer atlas;
    std::ostringstream log;
    PipelineError error;
    EXPECT_TRUE(compose_icon_atlas(solid(40, 10, k_red), ShadowSpec{}, atlas, log, error));
    EXPECT_EQ(atlas.width(), ICON_ATLAS_WIDTH);
    EXPECT_EQ(atlas.height(), ICON_ATLAS_HEIGHT);
    EXPECT_TRUE(log.str().find("Warning:") != std::string::npos);
    EXPECT_TRUE(log.str().find("Generated icon layer: 64x64 at position 2,2") != std::string::npos);
    EXPECT_TRUE(log.str().find("Generated icon layer: 8x8 at position 114,2") != std::string::npos);

    PipelineError empty;
    EXPECT_FALSE(compose_icon_atlas(PixelBuffer(4, 4), ShadowSpec{}, atlas, log, empty));
    EXPECT_EQ(empty.code, ErrorCode::EmptyImage);
}

static void test_process_picture() {
    std::vector<PixelBuffer> frames;
    frames.push_back(framed(20, 10, 5, k_red));
    std::optional<PixelBuffer> shadow = framed(10, 5, 3, Color{.r = 0, .g = 0, .b = 0, .a = 90});

    PictureResult result;
    std::ostringstream log;
    PipelineError error;
    EXPECT_TRUE(process_picture(std::move(frames), std::move(shadow), 1.0, ANCHOR_CENTER, result, log, error));
    EXPECT_EQ(result.frame_count, size_t{1});
    EXPECT_EQ(result.image.width(), 64);
    EXPECT_EQ(result.image.height(), 32);
    ASSERT_TRUE(result.shadow.has_value());
    // The shadow keeps the image's 64 / 20 ratio: 10 * 3.2 = 32.
    EXPECT_EQ(result.shadow->width(), 32);
    EXPECT_EQ(result.shadow->height(), 16);
    EXPECT_TRUE(log.str().find("Using alignment: (0.5, 0.5)") != std::string::npos);
    EXPECT_TRUE(log.str().find("Suggested offset for shadow alignment:") != std::string::npos);
}

static void test_process_picture_sheet() {
    std::vector<PixelBuffer> frames;
    frames.push_back(framed(8, 8, 1, k_red));
    frames.push_back(framed(8, 8, 1, k_green));
    frames.push_back(framed(8, 8, 1, k_blue));

    PictureResult result;
    std::ostringstream log;
    PipelineError error;
    EXPECT_TRUE(process_picture(std::move(frames), std::nullopt, 0.5, Anchor{}, result, log, error));
    EXPECT_EQ(result.frame_count, size_t{3});
    EXPECT_EQ(result.frame.width(), 32);
    EXPECT_EQ(result.image.width(), 96);
    EXPECT_EQ(result.image.height(), 32);
    EXPECT_EQ(result.image.at(40, 10), k_green);
    EXPECT_TRUE(log.str().find("Variation count: 3") != std::string::npos);

    std::vector<PixelBuffer> uneven;
    uneven.push_back(solid(8, 8, k_red));
    uneven.push_back(solid(8, 6, k_red));
    PipelineError mismatch;
    EXPECT_FALSE(process_picture(std::move(uneven), std::nullopt, 1.0, Anchor{}, result, log, mismatch));
    EXPECT_EQ(mismatch.code, ErrorCode::DimensionMismatch);
}

static void test_icon_batch() {
    const fs::path dir = make_temp_path("gearpix_icons");
    std::error_code ec;
    fs::create_directories(dir, ec);
    ASSERT_TRUE(!ec);

    PipelineError error;
    ASSERT_TRUE(save_png(dir / "gem.png", framed(24, 24, 4, k_green), error));
    ASSERT_TRUE(save_png(dir / "blank.png", PixelBuffer(8, 8), error));

    PixelBuffer reloaded;
    EXPECT_TRUE(load_image(dir / "gem.png", reloaded, error));
    EXPECT_EQ(reloaded.width(), 32);
    EXPECT_EQ(reloaded.at(10, 10), k_green);

    IconConfig config;
    config.inputs = {dir / "gem.png", dir / "blank.png"};
    config.threads = 2;

    std::ostringstream log;
    std::ostringstream errors;
    IconBatchSummary summary;
    EXPECT_TRUE(run_icon_batch(config, log, errors, summary, error));
    EXPECT_EQ(summary.processed, size_t{1});
    EXPECT_EQ(summary.failed, size_t{1});
    EXPECT_TRUE(errors.str().find("blank.png") != std::string::npos);
    EXPECT_TRUE(errors.str().find("[empty image]") != std::string::npos);

    PixelBuffer atlas;
    EXPECT_TRUE(load_image(dir / "gem-processed.png", atlas, error));
    EXPECT_EQ(atlas.width(), ICON_ATLAS_WIDTH);
    EXPECT_EQ(atlas.height(), ICON_ATLAS_HEIGHT);

    IconConfig missing = config;
    missing.inputs.push_back(dir / "nowhere.png");
    PipelineError missing_error;
    EXPECT_FALSE(run_icon_batch(missing, log, errors, summary, missing_error));
    EXPECT_EQ(missing_error.code, ErrorCode::MissingResource);

    PixelBuffer unreadable;
    PipelineError load_error;
    EXPECT_FALSE(load_image(dir / "nowhere.png", unreadable, load_error));
    EXPECT_EQ(load_error.code, ErrorCode::ImageLoad);

    fs::remove_all(dir, ec);
}

static bool write_tar(const fs::path& tar_path, const fs::path& member, const std::vector<std::string>& entry_names) {
    std::ifstream in(member, std::ios::binary);
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    struct archive* a = archive_write_new();
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        archive_write_free(a);
        return false;
    }
    bool ok = true;
    for (const auto& entry_name : entry_names) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, entry_name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(bytes.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        ok = ok && archive_write_header(a, entry) == ARCHIVE_OK
             && archive_write_data(a, bytes.data(), bytes.size()) == static_cast<la_ssize_t>(bytes.size());
        archive_entry_free(entry);
    }
    ok = archive_write_close(a) == ARCHIVE_OK && ok;
    archive_write_free(a);
    return ok;
}

static void test_archive_batch() {
    const fs::path dir = make_temp_path("gearpix_archive");
    std::error_code ec;
    fs::create_directories(dir / "out", ec);
    ASSERT_TRUE(!ec);

    PipelineError error;
    ASSERT_TRUE(save_png(dir / "coin.png", framed(16, 16, 2, k_red), error));
    ASSERT_TRUE(write_tar(dir / "icons.tar", dir / "coin.png", {"items/coin.png"}));
    EXPECT_TRUE(is_archive_path(dir / "icons.tar"));
    EXPECT_TRUE(is_archive_path("ICONS.TAR.GZ"));
    EXPECT_FALSE(is_archive_path(dir / "coin.png"));

    ExtractedArchive extracted;
    EXPECT_TRUE(extract_archive_images(dir / "icons.tar", extracted, error));
    ASSERT_TRUE(extracted.images.size() == 1);
    EXPECT_EQ(extracted.images.front().filename(), fs::path("coin.png"));
    const fs::path working_folder = extracted.working_folder;
    extracted.cleanup();
    EXPECT_FALSE(fs::exists(working_folder));

    IconConfig config;
    config.inputs = {dir / "icons.tar"};
    config.output_dir = dir / "out";
    std::ostringstream log;
    std::ostringstream errors;
    IconBatchSummary summary;
    EXPECT_TRUE(run_icon_batch(config, log, errors, summary, error));
    EXPECT_EQ(summary.processed, size_t{1});
    EXPECT_TRUE(fs::exists(dir / "out" / "coin-processed.png"));

    PipelineError bad_archive;
    std::ofstream(dir / "broken.tar", std::ios::binary) << "not an archive";
    EXPECT_FALSE(extract_archive_images(dir / "broken.tar", extracted, bad_archive));
    EXPECT_EQ(bad_archive.code, ErrorCode::Archive);

    fs::remove_all(dir, ec);
}

static void test_icon_batch_rejects_shared_outputs() {
    const fs::path dir = make_temp_path("gearpix_shared");
    std::error_code ec;
    fs::create_directories(dir / "a", ec);
    fs::create_directories(dir / "b", ec);
    fs::create_directories(dir / "out", ec);
    ASSERT_TRUE(!ec);

    PipelineError error;
    ASSERT_TRUE(save_png(dir / "a" / "gem.png", solid(8, 8, k_red), error));
    ASSERT_TRUE(save_png(dir / "b" / "gem.png", solid(8, 8, k_blue), error));

    IconConfig config;
    config.inputs = {dir / "a" / "gem.png", dir / "b" / "gem.png"};
    config.output_dir = dir / "out";
    config.threads = 2;

    std::ostringstream log;
    std::ostringstream errors;
    IconBatchSummary summary;
    PipelineError shared;
    EXPECT_FALSE(run_icon_batch(config, log, errors, summary, shared));
    EXPECT_EQ(shared.code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(shared.message.find("gem-processed.png") != std::string::npos);
    EXPECT_FALSE(fs::exists(dir / "out" / "gem-processed.png"));

    // The same input twice is also two writers of one file.
    IconConfig twice;
    twice.inputs = {dir / "a" / "gem.png", dir / "a" / "." / "gem.png"};
    PipelineError twice_error;
    EXPECT_FALSE(run_icon_batch(twice, log, errors, summary, twice_error));
    EXPECT_EQ(twice_error.code, ErrorCode::InvalidArgument);

    // Without a shared directory each output lands beside its source.
    config.output_dir.clear();
    PipelineError separate;
    EXPECT_TRUE(run_icon_batch(config, log, errors, summary, separate));
    EXPECT_EQ(summary.processed, size_t{2});

    ASSERT_TRUE(write_tar(dir / "dupes.tar", dir / "a" / "gem.png", {"left/gem.png", "right/gem.png"}));
    IconConfig archive_config;
    archive_config.inputs = {dir / "dupes.tar"};
    PipelineError archive_error;
    EXPECT_FALSE(run_icon_batch(archive_config, log, errors, summary, archive_error));
    EXPECT_EQ(archive_error.code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(fs::exists(dir / "gem-processed.png"));

    IconConfig bad_shadow;
    bad_shadow.inputs = {dir / "a" / "gem.png"};
    bad_shadow.shadow.blur_radius = 1000000000;
    PipelineError shadow_error;
    EXPECT_FALSE(run_icon_batch(bad_shadow, log, errors, summary, shadow_error));
    EXPECT_EQ(shadow_error.code, ErrorCode::InvalidArgument);

    fs::remove_all(dir, ec);
}

int main() {
    test_pixel_buffer_bounds();
    test_trim();
    test_trim_rejects_transparent();
    test_resize_with_aspect();
    test_resize_with_anchor();
    test_resize_rejects_bad_targets();
    test_resize_rejects_oversized_results();
    test_resample_interpolates();
    test_resize_preserves_aspect();
    test_sprite_sheet();
    test_blend_over();
    test_drop_shadow();
    test_drop_shadow_clips_at_edges();
    test_drop_shadow_extreme_parameters();
    test_gaussian_blur_spreads_alpha();
    test_icon_atlas();
    test_icon_atlas_padding();
    test_process_picture();
    test_process_picture_sheet();
    test_icon_batch();
    test_archive_batch();
    test_icon_batch_rejects_shared_outputs();
    return finish_tests("gearpix_pipeline_tests");
}
