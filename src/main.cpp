#include <tclap/CmdLine.h>

#include <iostream>
#include <string>

#include "dashgpx_app.hpp"

int main(int argc, const char **argv) {
    dashgpx::AppOptions options;

    TCLAP::CmdLine cmd("Extract a GPX track from the GPS overlay burned into a dashcam video", ' ', "1.0");

    TCLAP::UnlabeledValueArg<std::string> videoArg(
        "video", "Dashcam video file (mp4, avi, mov)", true, "", "video_path");
    TCLAP::ValueArg<std::string> startArg(
        "s", "start", "Wall-clock time of the first frame, 'YYYY-mm-dd HH:MM:SS' (UTC)", true, "", "datetime");
    TCLAP::ValueArg<std::string> outputArg(
        "o", "output", "GPX output path.  Default=<video>.gpx", false, "", "gpx_path");
    TCLAP::ValueArg<std::string> presetArg(
        "p", "preset", "Overlay position preset: default, bottom-left, bottom-right", false, "default", "preset");
    TCLAP::SwitchArg southSwitch("", "south", "Recording is in the southern hemisphere (latitude negative)", false);
    TCLAP::SwitchArg westSwitch("", "west", "Recording is in the western hemisphere (longitude negative)", false);

    try {
        cmd.setExceptionHandling(false);
        cmd.add(videoArg);
        cmd.add(startArg);
        cmd.add(outputArg);
        cmd.add(presetArg);
        cmd.add(southSwitch);
        cmd.add(westSwitch);
        cmd.parse(argc, argv);

        options.video_path = videoArg.getValue();
        options.start_time = startArg.getValue();
        options.output_path = outputArg.getValue();
        options.preset = presetArg.getValue();
        options.south = southSwitch.getValue();
        options.west = westSwitch.getValue();
    } catch (const TCLAP::ArgException &e) {
        std::cerr << "[Error] " << e.error() << " for arg " << e.argId() << std::endl;
        return 1;
    } catch (const TCLAP::ExitException &e) {
        return e.getExitStatus();
    }

    return dashgpx::runDashcamGpx(options);
}
