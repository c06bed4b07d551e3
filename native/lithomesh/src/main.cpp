// main.cpp — Command-line wrapper around the lithophane generator.
//
// Responsibilities:
// - Parse minimal flags (in/out, depths, header, preview size/step) and the three
//   coordinate expressions.
// - Load the input image, run generate_lithophane (or generate_preview), and save
//   the binary STL.
// - Print a short summary to stdout so wrapper scripts can parse it.

#include "expr.hpp"
#include "image_io.hpp"
#include "io_stl.hpp"
#include "lithophane.hpp"
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

static void usage(){
    fprintf(stderr, "lithomesh (v%s)\n", LITHOMESH_VERSION);
    fprintf(stderr, "Usage: lithomesh --in image --out out.stl [--white-depth d] [--black-depth d] [--header text]\n"
                    "                 [--overwrite] [--verify] [--quiet] [--progress-interval n] X_EXPR Y_EXPR Z_EXPR\n"
                    "       lithomesh --preview --width w --height h [--step s] --out out.stl [...] X_EXPR Y_EXPR Z_EXPR\n"
                    "Expressions use x, y (pixel column/row) and w, h (image width/height), e.g. \"x\" \"y\" \"0\".\n");
}

int main(int argc, char** argv){
    const char* in_path=nullptr; const char* out_path=nullptr;
    bool preview=false, overwrite=false, verify=false, quiet=false;
    long width=0, height=0, step=1;
    LithophaneOptions opt;
    const char* exprs[3]={nullptr,nullptr,nullptr}; int nexpr=0;
    try {
        for(int i=1;i<argc;i++){
            if(!strcmp(argv[i],"--in") && i+1<argc) in_path=argv[++i];
            else if(!strcmp(argv[i],"--out") && i+1<argc) out_path=argv[++i];
            else if(!strcmp(argv[i],"--white-depth") && i+1<argc) opt.white_depth=std::stof(argv[++i]);
            else if(!strcmp(argv[i],"--black-depth") && i+1<argc) opt.black_depth=std::stof(argv[++i]);
            else if(!strcmp(argv[i],"--header") && i+1<argc) opt.header=argv[++i];
            else if(!strcmp(argv[i],"--progress-interval") && i+1<argc) opt.progress_interval=std::stoi(argv[++i]);
            else if(!strcmp(argv[i],"--preview")) preview=true;
            else if(!strcmp(argv[i],"--width") && i+1<argc) width=std::stol(argv[++i]);
            else if(!strcmp(argv[i],"--height") && i+1<argc) height=std::stol(argv[++i]);
            else if(!strcmp(argv[i],"--step") && i+1<argc) step=std::stol(argv[++i]);
            else if(!strcmp(argv[i],"--overwrite")) overwrite=true;
            else if(!strcmp(argv[i],"--verify")) verify=true;
            else if(!strcmp(argv[i],"--quiet")) quiet=true;
            else if(strncmp(argv[i],"--",2) && nexpr<3) exprs[nexpr++]=argv[i]; // "-x" is a valid expression
            else { fprintf(stderr, "Unknown or incomplete option: %s\n", argv[i]); usage(); return 2; }
        }
    } catch(const std::exception&) {
        fprintf(stderr, "Invalid numeric option value\n"); usage(); return 2;
    }
    if(!out_path || nexpr!=3 || (!preview && !in_path)){ usage(); return 2; }
    if(preview && (width<0 || height<0 || step<1 || width>UINT32_MAX || height>UINT32_MAX || step>UINT32_MAX)){
        fprintf(stderr, "Preview needs --width/--height >= 0 and --step >= 1\n"); return 2;
    }

    SurfaceFns fns; std::string err;
    CoordFn* slots[3]={&fns.x,&fns.y,&fns.z};
    const char* names[3]={"x","y","z"};
    for(int k=0;k<3;k++){
        if(!compile_expression(exprs[k], *slots[k], err)){ fprintf(stderr, "Invalid %s expression: %s\n", names[k], err.c_str()); return 3; }
    }

    Mesh mesh; GenerateReport rep;
    if(preview){
        if(!generate_preview(fns, (uint32_t)width, (uint32_t)height, (uint32_t)step, opt, mesh, rep, err)){
            fprintf(stderr, "Error generating preview: %s\n", err.c_str()); return 4;
        }
    } else {
        GrayImage img;
        if(!load_gray_image(in_path, img, err)){ fprintf(stderr, "Error opening image file \"%s\": %s\n", in_path, err.c_str()); return 3; }
        if(!generate_lithophane(fns, img, opt, mesh, rep, err)){
            fprintf(stderr, "Error generating lithophane: %s\n", err.c_str()); return 4;
        }
    }

    if(!save_stl_binary(out_path, mesh, err, overwrite)){ fprintf(stderr, "Error saving lithophane to \"%s\": %s\n", out_path, err.c_str()); return 5; }

    if(verify){
        Mesh check; err.clear();
        if(!load_stl_binary(out_path, check, err) || check.num_triangles()!=mesh.num_triangles()){
            fprintf(stderr, "Verification of \"%s\" failed: %s\n", out_path, err.empty()? "triangle count differs" : err.c_str());
            return 5;
        }
    }

    // The two-line summary is meant for scripts; keep other output on stderr.
    if(!quiet) fprintf(stdout, "triangles: %zu\nvertices: %zu\n", rep.triangles, rep.vertices);
    return 0;
}
