//
// encode / decode / remove / print
//

#include <pngme/commands.hh>
#include <pngme/chunk.hh>
#include <pngme/chunk_tag.hh>
#include <pngme/file_io.hh>
#include <pngme/png.hh>
#include <ostream>

namespace pngme {

    static png load(const std::filesystem::path& path, const parse_options& options) {
        return png::parse(read_file(path), options);
    }

    void run_encode(const encode_args& args, std::ostream& out, const parse_options& options) {
        png image = load(args.file_path, options);

        auto tag = chunk_tag::from_string(args.chunk_type);
        const auto* text = reinterpret_cast<const std::byte*>(args.message.data());
        image.append_chunk(chunk(tag, std::vector<std::byte>(text, text + args.message.size())));

        if (args.output_file) {
            write_file(*args.output_file, image.as_bytes());
            out << "Wrote " << image.chunks().size() << " chunks to " << args.output_file->string() << "\n";
        }
    }

    void run_decode(const decode_args& args, std::ostream& out, const parse_options& options) {
        png image = load(args.file_path, options);

        if (const chunk* c = image.chunk_by_type(args.chunk_type)) {
            out << c->data_as_text() << "\n";
        } else {
            out << "That chunk doesn't exist\n";
        }
    }

    void run_remove(const remove_args& args, std::ostream& out, const parse_options& options) {
        png image = load(args.file_path, options);

        // TODO: write the stream back once remove is meant to persist
        chunk removed = image.remove_chunk(args.chunk_type);
        out << removed.data_as_text() << "\n";
    }

    void run_print(const print_args& args, std::ostream& out, const parse_options& options) {
        png image = load(args.file_path, options);
        out << image;
    }

}
