#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include <stdio.h>
#include <stdlib.h>
namespace fs = std::filesystem;

#include <color.hpp>
#include <color_metrics.hpp>
#include <kmeans.hpp>
#include <palette_sort.hpp>
#include <monochromatic.hpp>
#include <pixel_sampler.hpp>
#include <swatch.hpp>
#include "logging.hpp"

struct settings {
	std::string inpath;
	std::string outpath;
	std::string color;
	std::string metric = "luminance";
	size_t k = 6;
	size_t max_iterations = 100;
	size_t step = 3;
	int stride = 1;
	bool ascending = false;
};

static void print_palette(const std::vector<Pal::Color>& palette, Pal::metric_fn metric) {
	for(const Pal::Color& c : palette) {
		if(metric) {
			printf("%s  %.4f\n", Pal::to_hex(c).c_str(), metric(c));
		}
		else {
			printf("%s\n", Pal::to_hex(c).c_str());
		}
	}
}

static bool resolve_color(settings& set, Pal::Color& out) {
	if(set.color.empty()) {
		LOGERR("no color supplied, use -c <hex>");
		return false;
	}
	if(!Pal::parse_hex(set.color, out)) {
		LOGERR("couldn't parse color \"%s\"", set.color.c_str());
		return false;
	}
	return true;
}

namespace proc {
	bool extract(settings& set) {
		Pal::metric_fn metric = Pal::metric_by_name(set.metric);
		if(!metric) {
			LOGERR("unknown sort metric \"%s\"", set.metric.c_str());
			return false;
		}
		if(set.inpath.empty()) {
			LOGERR("no input image supplied, use -i <image>");
			return false;
		}

		std::vector<Pal::Color> points;
		if(!sample_image(fs::u8path(set.inpath), points, set.stride)) {
			return false;
		}
		LOGINF("sampled %zu pixels from %s", points.size(), set.inpath.c_str());

		std::vector<Pal::Color> palette = Pal::kmeans(points, set.k, set.max_iterations);
		if(palette.empty()) {
			LOGERR("no palette could be extracted from %s", set.inpath.c_str());
			return false;
		}
		palette = Pal::sort_colors(palette, set.ascending, metric);
		print_palette(palette, metric);

		if(!set.outpath.empty()) {
			return write_swatch(fs::u8path(set.outpath), palette);
		}
		return true;
	}
	bool mono(settings& set) {
		Pal::Color color;
		if(!resolve_color(set, color)) { return false; }

		std::vector<Pal::Color> gradient = Pal::monochromatic_colors(color, set.step);
		print_palette(gradient, nullptr);

		if(!set.outpath.empty()) {
			return write_swatch(fs::u8path(set.outpath), gradient);
		}
		return true;
	}
	bool metrics(settings& set) {
		Pal::Color color;
		if(!resolve_color(set, color)) { return false; }

		printf("color       %s\n", Pal::to_hex(color).c_str());
		printf("luminance   %.4f\n", Pal::luminance(color));
		printf("brightness  %.4f\n", Pal::brightness(color));
		printf("hue         %.0f\n", Pal::hue(color));
		printf("saturation  %.4f\n", Pal::saturation(color));
		printf("value       %.2f\n", Pal::value(color));
		return true;
	}
}

typedef bool (*procfn)(settings& set);
static std::map<std::string, procfn> procMap{
	{"extract", proc::extract},
	{"mono", proc::mono},
	{"metrics", proc::metrics},
};

static void print_usage() {
	printf(
		"usage: palettetools <extract|mono|metrics> [options]\n"
		"  -i <path>     input image (extract), or input directory with -d\n"
		"  -o <path>     write a PNG swatch, or output directory with -d\n"
		"  -c <hex>      color for mono and metrics\n"
		"  -k <n>        cluster count (6)\n"
		"  -n <n>        max iterations (100)\n"
		"  -m <metric>   luminance, brightness, hue, saturation, value (luminance)\n"
		"  -a            sort ascending instead of descending\n"
		"  -s <n>        monochromatic steps per side (3)\n"
		"  -p <n>        sample every n'th pixel (1)\n"
		"  -d <ext>      run extract on every file with this extension in -i, '_' for all\n"
		"  -r            recurse into subdirectories with -d\n"
		"  -l[+-][vewi]  toggle log channels, e.g. -l+v turns verbose on\n");
}

static bool parse_count(const char* arg, size_t& out) {
	char* end = nullptr;
	long long v = strtoll(arg, &end, 10);
	if(end == arg || *end != '\0' || v < 0) {
		LOGERR("\"%s\" is not a valid count", arg);
		return false;
	}
	out = (size_t)v;
	return true;
}

static bool func_handler(settings& set, procfn fn){
	LOGBLK
	return fn(set);
}

int main(int argc, char* argv[]) {

	logging::set_channel(logging::Cerror, true);
	logging::set_channel(logging::Cwarning, true);
	logging::set_channel(logging::Cinfo, true);
	logging::set_channel(logging::Cverbose, false);

	if(argc < 2){
		print_usage();
		return 1;
	}

	procfn fn = nullptr;
	settings set;
	std::string all_in_folder = "";
	bool recursive = false;
	for(int i = 1; i < argc; i++){
		if(argv[i][0] == '-' && argv[i][1] != '\0'){
			char opt = argv[i][1];
			if(opt == 'a'){ set.ascending = true; continue; }
			if(opt == 'r'){ recursive = true; continue; }
			if(opt == 'h'){ print_usage(); return 0; }
			if(opt == 'l'){
				//Logging settings. use - to set mode to "turn off", use + to set mode to "turn on".
				//example: -l+vewi turns on all channels
				// -l-e+v turns error off (-e), and verbose on (+v)
				//default mode is "turn on".
				bool mode = true;
				for(size_t progress = 2; argv[i][progress] != '\0'; progress++){
					switch(argv[i][progress]){
						case '-': mode = false; break;
						case '+': mode = true; break;
						case 'v': logging::set_channel(logging::Cverbose, mode); break;
						case 'e': logging::set_channel(logging::Cerror, mode); break;
						case 'w': logging::set_channel(logging::Cwarning, mode); break;
						case 'i': logging::set_channel(logging::Cinfo, mode); break;
						default: {
							LOGERR("argument \"%s\" could not be parsed properly. char '%c' is unknown", argv[i], argv[i][progress]);
							logging::flush();
							return 1;
						}
					}
				}
				continue;
			}

			//all options below require something after them
			if(i + 1 >= argc){
				LOGERR("option \"%s\" expects a value", argv[i]);
				logging::flush();
				return 1;
			}
			const char* val = argv[++i];
			bool ok = true;
			switch(opt){
				case 'i': set.inpath = val; break;
				case 'o': set.outpath = val; break;
				case 'c': set.color = val; break;
				case 'm': set.metric = val; break;
				case 'd': all_in_folder = val; break;
				case 'k': {
					ok = parse_count(val, set.k);
					if(ok && set.k == 0){
						LOGERR("cluster count must be at least 1");
						ok = false;
					}
					break;
				}
				case 'n': ok = parse_count(val, set.max_iterations); break;
				case 's': ok = parse_count(val, set.step); break;
				case 'p': {
					size_t stride = 1;
					ok = parse_count(val, stride);
					set.stride = stride ? (int)stride : 1;
					break;
				}
				default: {
					LOGERR("unknown option \"%s\"", argv[i - 1]);
					ok = false;
					break;
				}
			}
			if(!ok){ logging::flush(); return 1; }
		}else{
			auto found = procMap.find(argv[i]);
			if (found != procMap.end()) {
				fn = found->second;
			}else{
				LOGERR("unknown operation \"%s\"", argv[i]);
				logging::flush();
				return 1;
			}
		}
	}

	if(!fn){
		LOGERR("didn't find operation to do in the arguments supplied!");
		logging::flush();
		return 1;
	}

	bool success = true;
	if(all_in_folder == ""){
		success = func_handler(set, fn);
	}else {
		if(fn != proc::extract){
			LOGERR("-d only works with extract");
			logging::flush();
			return 1;
		}

		bool care_about_extension = (all_in_folder == "_") ? false : true;
		std::string real_in = set.inpath;
		std::string real_out = set.outpath;

		auto func = [&](const fs::path& p){
			if(!fs::is_regular_file(p)){ return; }
			if(care_about_extension && p.extension() != all_in_folder){ return; }

			set.inpath = p.u8string();
			fs::path rel_path = fs::relative(p, fs::u8path(real_in));
			if(!real_out.empty()){
				fs::path outpath = fs::u8path(real_out);
				outpath /= rel_path;
				outpath.replace_extension(".png");
				set.outpath = outpath.u8string();
			}

			LOGINF("handling file %s:", rel_path.u8string().c_str());
			printf("%s\n", rel_path.u8string().c_str());
			if(!func_handler(set, fn)){ success = false; }
		};

		std::error_code ec;
		if(recursive){
			for(const auto& p : fs::recursive_directory_iterator(fs::u8path(real_in), ec)){
				func(p.path());
			}
		}else{
			for(const auto& p : fs::directory_iterator(fs::u8path(real_in), ec)){
				func(p.path());
			}
		}
		if(ec){
			LOGERR("couldn't walk directory %s: %s", real_in.c_str(), ec.message().c_str());
			success = false;
		}
	}

	logging::flush();
	return success ? 0 : 1;
}
