#include "media_resolver.hpp"
#include "logging.hpp"
#include <iostream>
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE\n"
              << "Decodes the media stored for one post and prints its frames as JSON.\n"
              << "FILE is relative to the media root.\n"
              << "Options:\n"
              << "  -r, --media-root DIR   Media directory (required)\n"
              << "  -c, --config FILE      JSON file with limits and decoder options\n"
              << "  -t, --type TYPE        Media type: image, video (default: image)\n"
              << "  --fullsize NAME        Full-size variant below DIR/full\n"
              << "  --post-id NUM          Post id used in logs and output (default: 0)\n"
              << "  -v, --verbose          Enable debug logging\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string media_root;
    std::string config_file;
    mediaframes::MediaReference post;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-r" || arg == "--media-root") {
                if (++i < argc) media_root = argv[i];
            } else if (arg == "-c" || arg == "--config") {
                if (++i < argc) config_file = argv[i];
            } else if (arg == "-t" || arg == "--type") {
                if (++i < argc) {
                    std::string type = argv[i];
                    if (type == "image") {
                        post.type = mediaframes::MediaType::IMAGE;
                    } else if (type == "video") {
                        post.type = mediaframes::MediaType::VIDEO;
                    } else {
                        std::cerr << "Error: Unknown media type: " << type << "\n";
                        return 1;
                    }
                }
            } else if (arg == "--fullsize") {
                if (++i < argc) post.fullsize = std::string(argv[i]);
            } else if (arg == "--post-id") {
                if (++i < argc) post.post_id = std::stoll(argv[i]);
            } else if (arg == "-v" || arg == "--verbose") {
                mediaframes::set_log_level(mediaframes::LogLevel::Debug);
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (post.image.empty()) {
                post.image = arg;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid argument: " << e.what() << "\n";
        return 1;
    }

    if (media_root.empty() || post.image.empty()) {
        std::cerr << "Error: Media root and file are required\n";
        return 1;
    }

    try {
        mediaframes::Limits limits;
        mediaframes::VideoDecoderOptions options;
        if (!config_file.empty()) {
            json config = mediaframes::read_config_file(config_file);
            limits = mediaframes::Limits::from_json(config.value("limits", json::object()));
            options = mediaframes::VideoDecoderOptions::from_json(config.value("decoder", json::object()));
        }

        mediaframes::MediaResolver resolver(media_root, limits,
                                            mediaframes::make_default_registry(options));

        auto start_time = std::chrono::steady_clock::now();

        auto stream = resolver.get_frames(post);
        auto frames = mediaframes::collect_frames(*stream, static_cast<size_t>(limits.max_keyframes));

        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        json output_json;
        output_json["post_id"] = post.post_id;
        output_json["path"] = resolver.resolve_path(post);
        output_json["frames"] = json::array();
        for (const auto& frame : frames) {
            output_json["frames"].push_back(json(mediaframes::make_frame_info(post.post_id, frame)));
        }
        output_json["frame_count"] = frames.size();
        output_json["total_time_ms"] = total_time.count();

        std::cout << output_json.dump(2) << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
