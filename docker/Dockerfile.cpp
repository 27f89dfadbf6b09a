# life - Game of Life engine Dockerfile
# Multi-stage build producing a single static binary in an empty image

# =============================================================================
# Stage 1: Build base
# =============================================================================
FROM ubuntu:22.04 AS buildbase

# Prevent interactive prompts
ENV DEBIAN_FRONTEND=noninteractive

# Install build dependencies
RUN apt-get update && apt-get install -y --no-install-recommends \
    build-essential \
    cmake \
    libboost-system-dev \
    libboost-program-options-dev \
    && rm -rf /var/lib/apt/lists/*

WORKDIR /app

# =============================================================================
# Stage 2: Builder
# =============================================================================
FROM buildbase AS builder

ARG CMAKE_ARGS="-DLIFE_STATIC=ON -DLIFE_BUILD_TESTS=OFF"

COPY CMakeLists.txt ./
COPY cpp/ ./cpp/

RUN --mount=type=cache,target=/app/build \
    cmake -S . -B build -DCMAKE_BUILD_TYPE=Release ${CMAKE_ARGS} && \
    cmake --build build -j$(nproc) && \
    cp build/life /app/life

# =============================================================================
# Stage 3: Runtime
# =============================================================================
FROM scratch AS runtime

COPY --link --from=builder /app/life /life

# Defaults can be replaced with `docker run <image> --width 64 ...`
# or tuned through LIFE_* variables with `docker run -e LIFE_RENDER=1 ...`
ENTRYPOINT ["/life"]
CMD ["--generations", "51"]
