#ifndef CONFIG_HPP
#define CONFIG_HPP

// Defaults tuned against the 1:1 OPB-82 scheme export.
#define DEFAULT_CELL_SIZE 26
#define DEFAULT_MIN_AREA 100
#define DEFAULT_COLOR_TOLERANCE 25.0

struct CoreGridConfig {
    int cellSize = DEFAULT_CELL_SIZE;       // grid pitch in pixels
    int minArea = DEFAULT_MIN_AREA;         // blobs below this are anti-aliasing fringes
    double colorTolerance = DEFAULT_COLOR_TOLERANCE;

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

#endif  // CONFIG_HPP
